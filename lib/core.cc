#include <lexicon/core.hh>
#include <mutex>
#include <utility>

using namespace lex;

namespace {
std::mutex handler_mutex;
DiagnosticHandler handler;
}

auto lex::SetDiagnosticHandler(DiagnosticHandler h) -> DiagnosticHandler {
    std::unique_lock _{handler_mutex};
    return std::exchange(handler, std::move(h));
}

void lex::detail::EmitDiagnostic(std::string message) {
    std::unique_lock _{handler_mutex};
    if (handler) handler(std::move(message));
    else std::println(stderr, "{}", message);
}
