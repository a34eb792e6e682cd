// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "format.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace errol {

//==================================================================================================
// Format templates
//
// A template is literal text with {} placeholders. The text between the braces is ignored.
// "{{" is an escaped brace: it starts a literal "{" which runs up to the next '{'.
// An unterminated '{' makes the template malformed.
//==================================================================================================

struct Segment
{
    enum class Kind { literal, placeholder };

    Kind kind = Kind::literal;
    std::string_view text;
};

class TemplateSegmenter
{
    std::string_view rest_;
    bool failed_ = false;

public:
    constexpr explicit TemplateSegmenter(std::string_view tmpl) : rest_(tmpl) {}

    // Stores the next segment and returns true, or returns false at the end
    // of the template or if the template is malformed.
    constexpr bool Next(Segment& segment)
    {
        if (failed_ || rest_.empty())
            return false;

        if (rest_[0] != '{')
        {
            const size_t end = rest_.find('{');
            segment.kind = Segment::Kind::literal;
            segment.text = rest_.substr(0, end);
            rest_.remove_prefix(segment.text.size());
            return true;
        }

        if (rest_.size() >= 2 && rest_[1] == '{')
        {
            const size_t end = rest_.find('{', 2);
            segment.kind = Segment::Kind::literal;
            segment.text = rest_.substr(1, end == std::string_view::npos ? end : end - 1);
            rest_.remove_prefix(1 + segment.text.size());
            return true;
        }

        const size_t close = rest_.find('}', 1);
        if (close == std::string_view::npos)
        {
            failed_ = true;
            return false;
        }

        segment.kind = Segment::Kind::placeholder;
        segment.text = rest_.substr(0, close + 1);
        rest_.remove_prefix(close + 1);
        return true;
    }

    constexpr bool Failed() const { return failed_; }
};

// Returns the number of placeholders in tmpl, or -1 if tmpl is malformed.
constexpr int CountPlaceholders(std::string_view tmpl)
{
    TemplateSegmenter segmenter(tmpl);
    Segment segment{};

    int count = 0;
    while (segmenter.Next(segment))
    {
        if (segment.kind == Segment::Kind::placeholder)
            ++count;
    }

    return segmenter.Failed() ? -1 : count;
}

namespace impl {

template <typename String, typename... Args>
inline void PrintArgument(String& out, size_t index, const Args&... args)
{
    size_t i = 0;
    ((i++ == index ? Print(out, args) : void()), ...);
    static_cast<void>(i);
}

} // namespace impl

// FormatTo<Template>(out, args...);
//
// Appends the template to out, with the i-th placeholder replaced by Print(out, args[i]).
// Template must be a character array with static storage duration, e.g.
//
//  static constexpr char PointFormat[] = "({}, {})";
//  FormatTo<PointFormat>(out, x, y);
//
// Malformed templates and a mismatch between the number of placeholders and arguments
// are compile-time errors.
template <const char* Template, typename String, typename... Args>
void FormatTo(String& out, const Args&... args)
{
    static_assert(CountPlaceholders(Template) >= 0, "malformed format template");
    static_assert(CountPlaceholders(Template) == static_cast<int>(sizeof...(Args)),
                  "number of placeholders does not match the number of arguments");

    TemplateSegmenter segmenter(Template);
    Segment segment{};

    size_t next_argument = 0;
    while (segmenter.Next(segment))
    {
        if (segment.kind == Segment::Kind::literal)
            out.append(segment.text.data(), segment.text.size());
        else
            impl::PrintArgument(out, next_argument++, args...);
    }
}

template <const char* Template, typename... Args>
std::string Format(const Args&... args)
{
    std::string out;
    FormatTo<Template>(out, args...);
    return out;
}

} // namespace errol
