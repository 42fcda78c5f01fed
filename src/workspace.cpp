#include "musedna/workspace.hpp"

#include <algorithm>
#include <stdexcept>

namespace musedna {

Workspace::Workspace() : plan(nullptr) {}

Workspace::~Workspace() {
    if (plan)
        fft_destroy_plan(plan);
}

void Workspace::init(size_t n) {
    if (n == 0)
        throw std::invalid_argument("FFT length must be positive");
    if (N == n && plan)
        return;

    if (plan) {
        fft_destroy_plan(plan);
        plan = nullptr;
    }
    N = n;
    rxbuf.assign(N, {0.0f, 0.0f});
    fftbuf.assign(N, {0.0f, 0.0f});
    magnitude.assign(N, 0.0f);

    plan = fft_create_plan(
        static_cast<unsigned int>(N),
        reinterpret_cast<liquid_float_complex*>(rxbuf.data()),
        reinterpret_cast<liquid_float_complex*>(fftbuf.data()),
        LIQUID_FFT_FORWARD,
        0);
    if (!plan)
        throw std::runtime_error("liquid-dsp failed to create an FFT plan");
}

void Workspace::fft(const std::complex<float>* in, std::complex<float>* out) {
    if (in != rxbuf.data())
        std::copy(in, in + N, rxbuf.begin());
    fft_execute(plan);
    if (out != fftbuf.data())
        std::copy(fftbuf.begin(), fftbuf.begin() + N, out);
}

} // namespace musedna
