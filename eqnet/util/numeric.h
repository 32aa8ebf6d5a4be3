#pragma once


namespace eqnet
{
namespace util
{
// Compensated summation. Keeps the simulation clock from drifting when many
// small steps are accumulated (1000 * 0.001 == 1 exactly).
template <typename Prec>
class kahan_sum
{
public:
	kahan_sum() = default;
	explicit kahan_sum( Prec init )
	    : _sum( init )
	{
	}

	// Adds delta to the sum. Returns the new total.
	Prec add( Prec delta )
	{
		auto y = delta - _c;
		auto t = _sum + y;
		_c = ( t - _sum ) - y;
		_sum = t;

		return _sum;
	}

	Prec value() const { return _sum; }
	operator Prec() const { return _sum; }

private:
	Prec _c = 0;
	Prec _sum = 0;
};
} // namespace util
} // namespace eqnet
