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

#include "corpus.hpp"

#include "../core/containers.hpp"
#include "../core/string_utils.hpp"

namespace bastion::pattern {

namespace {

// U+2215 DIVISION SLASH, a common look-alike for '/'
constexpr std::string_view DIVISION_SLASH = "\xE2\x88\x95";

void push_unique(std::vector<std::string>& out, std::string value) {
    for (const auto& existing : out) {
        if (existing == value) {
            return;
        }
    }
    out.push_back(std::move(value));
}

}  // namespace

const std::vector<std::string>& fixed_corpus() {
    static const std::vector<std::string> corpus = {
        // Common files
        "file.txt",
        "script.js",
        "index.html",
        "style.css",
        "config.json",
        "package.json",
        ".env",
        ".gitignore",
        "README.md",
        "test.spec.js",
        // Paths
        "src/index.js",
        "dist/bundle.js",
        "node_modules/package/index.js",
        "../parent/file.txt",
        "../../grandparent/file.txt",
        "./current/file.txt",
        "/absolute/path/file.txt",
        "relative/path/file.txt",
        // Attack strings
        "../../../etc/passwd",
        "..\\..\\..\\windows\\system32\\cmd.exe",
        "file.txt; rm -rf /",
        "file.txt && echo hacked",
        "file.txt | cat /etc/passwd",
        std::string("file.txt\0.jpg", 13),
        "file.txt%00.jpg",
        "%2e%2e%2f%2e%2e%2f%2e%2e%2fetc%2fpasswd",
        // Command-like tokens
        "test",
        "test.js",
        "path/to/file",
        "cmd.exe",
        "/bin/bash",
        "script.sh",
    };
    return corpus;
}

bool is_fixed_corpus_entry(std::string_view input) {
    static const core::fast_set<std::string> index = []() {
        core::fast_set<std::string> set;
        for (const auto& entry : fixed_corpus()) {
            set.insert(entry);
        }
        return set;
    }();
    return index.contains(std::string(input));
}

std::vector<std::string> pattern_variants(std::string_view pattern, PatternKind kind) {
    std::vector<std::string> variants;

    if (kind == PatternKind::Glob) {
        if (pattern.find('*') != std::string_view::npos) {
            push_unique(variants, core::replace_all(pattern, "*", "test"));
            push_unique(variants, core::replace_all(pattern, "*", ""));
            push_unique(variants, core::replace_all(pattern, "*", "a/b/c"));
        }
        if (pattern.find('?') != std::string_view::npos) {
            push_unique(variants, core::replace_all(pattern, "?", "x"));
        }
    } else if (kind == PatternKind::Literal) {
        std::string p(pattern);
        push_unique(variants, p + ".txt");
        push_unique(variants, "prefix-" + p);
        push_unique(variants, p + "-suffix");
        push_unique(variants, core::to_upper(p));
        push_unique(variants, core::to_lower(p));
    }

    return variants;
}

std::vector<std::string> encoding_variants(std::string_view pattern) {
    std::vector<std::string> variants;
    std::string encoded = url::encode_component(pattern);

    push_unique(variants, encoded);
    push_unique(variants, core::replace_all(pattern, "/", "%2F"));
    push_unique(variants, core::replace_all(pattern, ".", "%2E"));
    push_unique(variants, core::replace_all(pattern, "/", DIVISION_SLASH));
    push_unique(variants, url::encode_component(encoded));

    return variants;
}

std::vector<std::string> generate_test_inputs(const Matcher& a, const Matcher& b) {
    std::vector<std::string> inputs;
    core::fast_set<std::string> seen;

    auto add = [&](const std::string& input) {
        if (seen.insert(input).second) {
            inputs.push_back(input);
        }
    };

    add(a.source());
    add(b.source());
    for (const auto& v : a.variants()) {
        add(v);
    }
    for (const auto& v : b.variants()) {
        add(v);
    }
    for (const auto& entry : fixed_corpus()) {
        add(entry);
    }

    return inputs;
}

}  // namespace bastion::pattern
