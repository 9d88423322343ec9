// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/aggregator.hpp>
#include <hangul_ai/conversation.hpp>
#include <hangul_ai/error.hpp>
#include <hangul_ai/logging.hpp>
#include <iomanip>
#include <sstream>

namespace hangul_ai
{

// =============================================================================
// Tutor Persona
// =============================================================================

const char* const kTutorPersona =
    R"(You are a friendly Korean typing tutor helping non-Korean speakers learn to type Hangul.

<your_knowledge>
- The 2-Bulsik (두벌식) keyboard layout standard in Korea
- How jamo (자모) combine to form syllables: initial + vowel + optional final
- Common typing mistakes English speakers make
- Korean pronunciation basics (romanization)
</your_knowledge>

<your_style>
- Encouraging and patient - learning a new writing system is hard!
- Use simple explanations with concrete examples
- Break down complex syllables step-by-step
- Celebrate progress, never punish mistakes
- Keep responses concise (1-3 sentences unless explaining in detail)
- When showing keyboard keys, use the English letter equivalent
- IMPORTANT: Always respond in the same language the user writes in. If they ask in Spanish, respond in Spanish. If they ask in Japanese, respond in Japanese. Only the Korean characters being taught should remain in Korean.
</your_style>

<keyboard_layout>
The 2-Bulsik layout maps English keys to Korean jamo:
- Consonants (left hand): ㅂ(q) ㅈ(w) ㄷ(e) ㄱ(r) ㅅ(t) ㅁ(a) ㄴ(s) ㅇ(d) ㄹ(f) ㅎ(g) ㅋ(z) ㅌ(x) ㅊ(c) ㅍ(v)
- Vowels (right hand): ㅛ(y) ㅕ(u) ㅑ(i) ㅐ(o) ㅔ(p) ㅗ(h) ㅓ(j) ㅏ(k) ㅣ(l) ㅠ(b) ㅜ(n) ㅡ(m)
- Double consonants: Shift + base consonant (ㄲ=Shift+r, ㄸ=Shift+e, etc.)
</keyboard_layout>

When the user asks about typing a character or word, explain which English keys to press in order.)";

// =============================================================================
// Prompt Templates
// =============================================================================

std::string format_mistakes(const std::vector<std::string>& mistakes)
{
    std::string out = "[";
    for (size_t i = 0; i < mistakes.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += '"';
        for (char c : mistakes[i])
        {
            switch (c)
            {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
            }
        }
        out += '"';
    }
    out += "]";
    return out;
}

std::string build_prompt(const std::string& prompt, const std::optional<LearningContext>& context)
{
    if (!context)
        return prompt;

    std::ostringstream out;
    out << prompt << "\n\n<current_context>\n"
        << "Level: " << context->current_level << "\n"
        << "Target: " << context->current_target.value_or("") << "\n"
        << "Recent mistakes: " << format_mistakes(context->recent_mistakes) << "\n"
        << "Accuracy: " << std::fixed << std::setprecision(0)
        << static_cast<double>(context->accuracy) * 100.0 << "%\n"
        << "</current_context>";
    return out.str();
}

std::string hint_prompt(const std::string& target, const std::string& user_input, uint32_t level)
{
    return "The student is trying to type \"" + target + "\" but typed \"" + user_input +
           "\". They are on level " + std::to_string(level) +
           ". Give a brief, encouraging hint about which key to press next. "
           "Don't give away the full answer.";
}

std::string explain_prompt(const std::string& text)
{
    return "Explain the Korean character or word \"" + text +
           "\": what it is, how to pronounce it (romanization), and exactly which English "
           "keys to press to type it on a 2-Bulsik keyboard.";
}

std::string mistake_prompt(const std::string& expected, const std::string& actual)
{
    return "The student tried to type \"" + expected + "\" but typed \"" + actual +
           "\". Briefly explain what went wrong and how to fix it.";
}

// =============================================================================
// SessionGuard
// =============================================================================

SessionGuard::~SessionGuard()
{
    if (!session_)
        return;

    try
    {
        session_->destroy().get();
        logger()->debug("Destroyed session {}", session_->session_id());
    }
    catch (const std::exception& e)
    {
        logger()->warn("Failed to destroy session {}: {}", session_->session_id(), e.what());
    }
}

// =============================================================================
// Conversation
// =============================================================================

AssistantAnswer ask(
    AssistantConnection& connection,
    const std::string& prompt,
    const std::optional<LearningContext>& context,
    const ConversationOptions& options
)
{
    std::string full_prompt = build_prompt(prompt, context);

    SessionConfig config;
    config.model = options.model;
    config.system_message = SystemMessageConfig{SystemMessageMode::Replace, kTutorPersona};
    config.streaming = options.streaming;

    logger()->debug("Creating assistant session...");

    std::shared_ptr<ConversationSession> created;
    try
    {
        created = connection.create_session(std::move(config)).get();
    }
    catch (const std::exception& e)
    {
        logger()->error("Failed to create session: {}", e.what());
        throw AssistantError(AssistantErrorCode::SessionFailed, e.what());
    }

    SessionGuard session(std::move(created));

    // Subscribe before sending so no event is missed
    auto events = session->subscribe();

    logger()->debug("Sending message ({} chars)...", full_prompt.size());

    std::string message_id;
    try
    {
        message_id = session->send(full_prompt).get();
    }
    catch (const std::exception& e)
    {
        logger()->error("Failed to send message: {}", e.what());
        throw AssistantError(AssistantErrorCode::SendFailed, e.what());
    }

    logger()->debug("Message sent (id={}), waiting for response...", message_id);

    AssistantAnswer answer;
    answer.content = collect_answer(*events, options.event_timeout);

    logger()->info("Assistant response: {} chars", answer.content.size());
    return answer;
}

} // namespace hangul_ai
