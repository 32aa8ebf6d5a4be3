#pragma once

#include <eqnet/model.h>


namespace eqnet
{
namespace models
{
// Leaky integrate-and-fire, time in ms, potentials in mV.
struct lif
{
	static model_desc desc(
	    double v_rest = -65.0,
	    double v_reset = -70.0,
	    double v_thres = -50.0,
	    double tau = 10.0,
	    double refractory = 2.0 )
	{
		model_desc m;
		m.name = "lif";
		m.state = { { "v", v_rest } };
		m.params = {
		    { "v_rest", v_rest }, { "v_reset", v_reset }, { "v_thres", v_thres }, { "tau", tau }, { "R", 10.0 } };
		m.update = { "dv/dt = (v_rest - v + R * I_ext) / tau : mV" };
		m.threshold = "v > v_thres";
		m.reset = { "v = v_reset" };
		m.refractory = refractory;
		return m;
	}
};
} // namespace models
} // namespace eqnet
