#pragma once

#include <eqnet/model.h>


namespace eqnet
{
namespace models
{
// Izhikevich (2003) simple model, time in ms. Defaults: regular spiking.
struct izhikevich
{
	static model_desc desc( double a = 0.02, double b = 0.2, double c = -65.0, double d = 8.0 )
	{
		model_desc m;
		m.name = "izhikevich";
		m.state = { { "v", c }, { "u", b * c } };
		m.params = { { "a", a }, { "b", b }, { "c", c }, { "d", d } };
		m.update = {
		    "dv/dt = 0.04 * v^2 + 5 * v + 140 - u + I_ext : mV", //
		    "du/dt = a * (b * v - u)"                           //
		};
		m.threshold = "v >= 30";
		m.reset = { "v = c", "u = u + d" };
		return m;
	}
};
} // namespace models
} // namespace eqnet
