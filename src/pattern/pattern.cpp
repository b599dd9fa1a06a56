/*
 * Copyright 2025 Bastion Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Bastion Pattern Layer - Pattern Classification and Compiled Matchers

#include "pattern.hpp"

#include "corpus.hpp"

namespace bastion::pattern {

PatternKind classify(std::string_view pattern) noexcept {
    if (pattern.find_first_of("*?[") != std::string_view::npos) {
        return PatternKind::Glob;
    }
    if (pattern.find_first_of("\\^$(|") != std::string_view::npos) {
        return PatternKind::Regex;
    }
    return PatternKind::Literal;
}

std::string_view to_string(PatternKind kind) noexcept {
    switch (kind) {
        case PatternKind::Literal:
            return "literal";
        case PatternKind::Glob:
            return "glob";
        case PatternKind::Regex:
            return "regex";
    }
    return "literal";
}

std::optional<PatternKind> parse_pattern_kind(std::string_view name) noexcept {
    if (name == "literal")
        return PatternKind::Literal;
    if (name == "glob")
        return PatternKind::Glob;
    if (name == "regex")
        return PatternKind::Regex;
    return std::nullopt;
}

std::string glob_to_regex(std::string_view glob) {
    std::string regex = "^";
    regex.reserve(glob.size() * 2 + 2);

    for (size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];
        if (c == '*') {
            // Collapse "**" runs so matching stays linear
            while (i + 1 < glob.size() && glob[i + 1] == '*') {
                ++i;
            }
            regex += ".*";
        } else if (c == '?') {
            regex += '.';
        } else {
            regex += escape(std::string_view(&c, 1));
        }
    }

    regex += '$';
    return regex;
}

std::shared_ptr<const Matcher> Matcher::compile(std::string_view source, PatternKind kind) {
    std::shared_ptr<Matcher> matcher(new Matcher());
    matcher->source_ = std::string(source);
    matcher->kind_ = kind;

    switch (kind) {
        case PatternKind::Literal:
            matcher->expression_ = matcher->source_;
            matcher->anchored_ = true;
            matcher->prefix_ = matcher->source_;
            matcher->suffix_ = matcher->source_;
            break;

        case PatternKind::Glob: {
            matcher->expression_ = glob_to_regex(source);
            matcher->regex_ = Regex::compile(matcher->expression_, matcher->compile_error_);
            matcher->anchored_ = matcher->regex_.has_value();

            size_t first = source.find_first_of("*?");
            size_t last = source.find_last_of("*?");
            matcher->prefix_ = std::string(source.substr(0, first));
            matcher->suffix_ = std::string(source.substr(last + 1));
            break;
        }

        case PatternKind::Regex:
            matcher->expression_ = matcher->source_;
            matcher->regex_ = Regex::compile(matcher->expression_, matcher->compile_error_);
            break;
    }

    if (kind != PatternKind::Literal && !matcher->regex_) {
        // Unparseable: search for the original text verbatim
        matcher->fell_back_ = true;
        matcher->anchored_ = false;
        matcher->expression_ = escape(source);
        std::string ignored;
        matcher->regex_ = Regex::compile(matcher->expression_, ignored);
    }

    const auto& corpus = fixed_corpus();
    for (size_t i = 0; i < corpus.size(); ++i) {
        if (matcher->matches(corpus[i])) {
            matcher->corpus_mask_ |= (uint64_t{1} << i);
        }
    }

    matcher->variants_ = pattern_variants(source, kind);
    auto encoded = encoding_variants(source);
    matcher->variants_.insert(matcher->variants_.end(), std::make_move_iterator(encoded.begin()),
                              std::make_move_iterator(encoded.end()));

    return matcher;
}

bool Matcher::matches(std::string_view input) const {
    if (kind_ == PatternKind::Literal) {
        return input == source_;
    }
    return regex_ && regex_->matches(input);
}

bool provably_disjoint(const Matcher& a, const Matcher& b) {
    // A literal matches exactly one string, so the question is decidable outright
    if (a.kind() == PatternKind::Literal) {
        return !b.matches(a.source());
    }
    if (b.kind() == PatternKind::Literal) {
        return !a.matches(b.source());
    }

    if (!a.anchored() || !b.anchored()) {
        return false;
    }

    auto compatible_prefix = [](std::string_view x, std::string_view y) {
        return x.size() <= y.size() ? y.starts_with(x) : x.starts_with(y);
    };
    auto compatible_suffix = [](std::string_view x, std::string_view y) {
        return x.size() <= y.size() ? y.ends_with(x) : x.ends_with(y);
    };

    return !compatible_prefix(a.literal_prefix(), b.literal_prefix()) ||
           !compatible_suffix(a.literal_suffix(), b.literal_suffix());
}

}  // namespace bastion::pattern
