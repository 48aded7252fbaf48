#include "mz/session/audio_sink.hpp"

#include "mz/session/session_engine.hpp"

namespace mz::session {

completion_token::completion_token(std::weak_ptr<session_engine> engine, std::uint64_t generation)
    : m_engine(std::move(engine))
    , m_generation(generation)
{
}

void completion_token::complete() const
{
    signal(std::nullopt);
}

void completion_token::fail(const std::string& reason) const
{
    signal(reason);
}

void completion_token::signal(std::optional<std::string> failure) const
{
    // The session is gone; nothing to advance
    if (auto engine = m_engine.lock()) {
        engine->signal_completion(m_generation, std::move(failure));
    }
}

} // namespace mz::session
