#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <liquid/liquid.h>

namespace musedna {

// Scratch buffers plus a liquid-dsp forward FFT plan for one analysis length.
// The detector reuses a single workspace for every tone window of a decode.
class Workspace {
public:
    Workspace();
    ~Workspace();
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    // (Re)plan for an n-point transform. No-op if already planned for n.
    void init(size_t n);
    void fft(const std::complex<float>* in, std::complex<float>* out);

    size_t N{0};

    std::vector<std::complex<float>> rxbuf;
    std::vector<std::complex<float>> fftbuf;
    std::vector<float> magnitude;

private:
    fftplan plan{nullptr};
};

} // namespace musedna
