#pragma once
#include "gateway/errors.hpp"

#include <string>
#include <string_view>

// Receives payloads the codec could not decode. Injected into the codec so the
// orchestrator (or a test) decides where diagnostics go.
struct IDiagnosticSink
{
    virtual ~IDiagnosticSink() = default;
    virtual void decode_failed(const DecodeError &err) = 0;
};

// Default sink: one line per failure on std::cerr.
class StderrDiagnosticSink : public IDiagnosticSink
{
public:
    void decode_failed(const DecodeError &err) override;
};

// Bytes as a single log-safe line; non-printable bytes become \xNN.
std::string printable_bytes(std::string_view bytes);
