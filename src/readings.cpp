#include "readings.h"

#include <math.h>

static constexpr double kTemperatureBaseC = 20.0;
static constexpr double kTemperatureSpreadC = 5.0;
static constexpr double kHumidityBasePct = 50.0;
static constexpr double kHumiditySpreadPct = 15.0;

// [0, 1)
static double unitRandom(ReadingRandomFn rng)
{
    return (double)rng() / 4294967296.0;
}

static double uniform(ReadingRandomFn rng, double lo, double hi)
{
    return lo + (hi - lo) * unitRandom(rng);
}

static double round2(double v)
{
    return round(v * 100.0) / 100.0;
}

TelemetrySample readings_sample(ReadingRandomFn rng)
{
    TelemetrySample s{};
    // Base value, symmetric swing, then up to one unit of sensor noise on top.
    s.temperature = round2(kTemperatureBaseC + uniform(rng, -kTemperatureSpreadC, kTemperatureSpreadC) + unitRandom(rng));
    s.humidity = round2(kHumidityBasePct + uniform(rng, -kHumiditySpreadPct, kHumiditySpreadPct) + unitRandom(rng));
    return s;
}
