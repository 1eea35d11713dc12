#include "gateway/codec.hpp"

#include "gateway/inflate.hpp"

#include <utility>

using json = nlohmann::json;

static DecodeOutcome parse_payload(const std::string &text, const std::string &raw, bool binary,
                                   std::optional<std::string> inflated, IDiagnosticSink &sink)
{
    try
    {
        return DecodeOutcome{json::parse(text), std::nullopt};
    }
    catch (const json::parse_error &e)
    {
        DecodeError err(std::string("json parse failed: ") + e.what(), raw, binary, std::move(inflated));
        sink.decode_failed(err);
        return DecodeOutcome{std::nullopt, std::move(err)};
    }
}

std::optional<DecodeOutcome> decode_frame(const WireFrame &frame, IDiagnosticSink &sink)
{
    if (const auto *text = std::get_if<TextFrame>(&frame))
        return parse_payload(text->payload, text->payload, false, std::nullopt, sink);

    if (const auto *bin = std::get_if<BinaryFrame>(&frame))
    {
        std::string inflated, why;
        if (!zlib_inflate(bin->payload, inflated, why))
        {
            DecodeError err("zlib inflate failed: " + why, bin->payload, true);
            sink.decode_failed(err);
            return DecodeOutcome{std::nullopt, std::move(err)};
        }
        return parse_payload(inflated, bin->payload, true, inflated, sink);
    }

    return std::nullopt;
}

GatewayCodec::GatewayCodec(GatewayConnection conn, const GatewayConfig &cfg, std::shared_ptr<IDiagnosticSink> sink)
    : conn_(std::move(conn)),
      capture_receipts_(cfg.capture_receipts),
      close_policy_(cfg.close_policy),
      sink_(sink ? std::move(sink) : std::make_shared<StderrDiagnosticSink>())
{
}

std::optional<ReceivedEvent> GatewayCodec::receive_decoded(bool blocking)
{
    for (;;)
    {
        auto frame = conn_.read_frame(blocking);
        if (!frame)
            return std::nullopt;

        if (const auto *close = std::get_if<CloseFrame>(&*frame))
        {
            if (close_policy_ == ClosePolicy::no_message)
                return std::nullopt;
            throw ConnectionClosedError(close->code, close->reason);
        }

        DecodedEvent event;
        if (capture_receipts_)
            event.receipt = ReceiptMetadata{std::chrono::system_clock::now(), std::chrono::steady_clock::now(), *frame};

        auto outcome = decode_frame(*frame, *sink_);
        if (!outcome)
            continue; // control frame, keep reading
        return ReceivedEvent{std::move(event), std::move(*outcome)};
    }
}

void GatewayCodec::send_encoded(const json &value)
{
    std::string body;
    try
    {
        body = value.dump();
    }
    catch (const json::type_error &e)
    {
        throw EncodeError(std::string("json encode failed: ") + e.what());
    }
    conn_.write_text(body);
}
