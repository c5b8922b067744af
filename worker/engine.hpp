#pragma once

// ============================================================
// engine.hpp -- Conversion engine seen from the worker:
//               command list + input bytes in, output bytes out
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <functional>

struct EngineJob {
    std::string              input_name;   // file name the args refer to
    std::vector<u8>          input;
    std::vector<std::string> args;         // e.g. {"-i", input_name, ..., output_name}
    std::string              output_name;
};

class ConversionEngine {
public:
    // fraction in [0, 1]
    using ProgressFn = std::function<void(double fraction)>;

    virtual ~ConversionEngine() = default;

    // One-time initialisation; the worker announces READY after it.
    // Throws RelayError(ENGINE_FAILURE) when the engine is unusable.
    virtual void load() = 0;

    virtual bool loaded() const = 0;

    // Throws RelayError(ENGINE_FAILURE) with the engine's own message
    virtual std::vector<u8> run(const EngineJob& job, const ProgressFn& progress) = 0;
};
