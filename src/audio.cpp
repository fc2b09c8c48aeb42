#include "auxon/audio.h"

#include <algorithm>
#include <cmath>

namespace auxon {

SampleBuffer resampleLinear(const SampleBuffer& input, int inputRate, int outputRate) {
    if (inputRate == outputRate || input.empty() || inputRate <= 0 || outputRate <= 0) {
        return input;
    }

    const double step = static_cast<double>(inputRate) / outputRate;
    const auto outCount = static_cast<std::size_t>(
        std::floor(static_cast<double>(input.size() - 1) / step)) + 1;

    SampleBuffer out(outCount);
    for (std::size_t i = 0; i < outCount; ++i) {
        double pos = i * step;
        auto idx = static_cast<std::size_t>(pos);
        double frac = pos - idx;

        double a = input[idx];
        double b = (idx + 1 < input.size()) ? input[idx + 1] : a;
        double v = std::round(a + (b - a) * frac);
        out[i] = static_cast<std::int16_t>(std::clamp(v, -32768.0, 32767.0));
    }
    return out;
}

} // namespace auxon
