#include "envelope.hpp"

#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

struct EnvelopeToJson {
    json operator()(const Success& s) const { return {{"text", s.text}}; }
    json operator()(const Failure& f) const { return {{"error", f.error}}; }
};

} // namespace

std::string to_json(const Envelope& envelope) {
    return std::visit(EnvelopeToJson{}, envelope)
        .dump(-1, ' ', false, json::error_handler_t::replace);
}

int emit(const Envelope& envelope, std::FILE* out, std::FILE* err) {
    auto line = to_json(envelope);
    int status = 0;

    if (std::holds_alternative<Success>(envelope)) {
        std::println(out, "{}", line);
    } else {
        std::println(err, "{}", line);
        status = 1;
    }

    // stderr buffering differs between platforms; make sure nothing is lost
    // on exit.
    std::fflush(out);
    std::fflush(err);
    return status;
}
