/**
 * Noos - Compiled Template
 * 
 * A template string pre-scanned for a closed set of placeholders,
 * so substitutions can be applied in a single pass per render.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "HtmlEscape.hpp"
#include "PlaceholderScanner.hpp"

namespace noos {

/**
 * One row of a placeholder table
 * 
 * Maps a placeholder kind to its name in templates and to the function
 * extracting its value from the render context. Values are HTML-escaped
 * unless `escape` is false (used for content that is already HTML).
 */
template <typename Kind, typename Context>
struct PlaceholderSpec {
    Kind kind;
    std::string_view name;
    std::string (*value)(const Context&);
    bool escape = true;
};

/**
 * A live placeholder occurrence in a compiled template
 */
template <typename Kind>
struct Occurrence {
    std::size_t start = 0;
    std::size_t end = 0;
    Kind kind;
};

/**
 * Template over a closed placeholder set
 * 
 * Traits must provide:
 * - `Kind`: enum class of placeholder kinds, numbered from 0
 * - `Context`: data a render reads its values from
 * - `NAME`: short description used in log messages
 * - `SPECS`: std::array of PlaceholderSpec<Kind, Context> in Kind order
 * 
 * Offsets refer to the owned text, which never changes after
 * construction. A compiled template is immutable and may be shared
 * between threads without locking.
 */
template <typename Traits>
class CompiledTemplate {
public:
    using Kind = typename Traits::Kind;
    using Context = typename Traits::Context;

    static constexpr std::size_t KIND_COUNT = Traits::SPECS.size();

    /**
     * Escaped substitution values, indexed by kind
     * 
     * Only kinds present in the template are filled by resolve().
     */
    using Values = std::array<std::string, KIND_COUNT>;

    /**
     * Position of a kind's value in Values
     */
    static constexpr std::size_t valueIndex(Kind kind) {
        return static_cast<std::size_t>(kind);
    }

    explicit CompiledTemplate(std::string text)
        : m_text(std::move(text))
    {
        static_assert(specsInKindOrder(), "placeholder table must be listed in Kind order");

        for (const auto& spec : Traits::SPECS) {
            auto scan = scanPlaceholder(m_text, spec.name);
            for (const auto& span : scan.live) {
                m_occurrences.push_back({span.start, span.end, spec.kind});
                m_present[valueIndex(spec.kind)] = true;
            }
            m_escapes.insert(m_escapes.end(), scan.escapes.begin(), scan.escapes.end());
        }

        std::sort(m_occurrences.begin(), m_occurrences.end(),
            [](const Occurrence<Kind>& a, const Occurrence<Kind>& b) {
                return a.start < b.start;
            });
        std::sort(m_escapes.begin(), m_escapes.end());

        buildSplices();

        if (m_occurrences.empty()) {
            spdlog::warn("{} template contains no placeholders", Traits::NAME);
        }
        spdlog::debug("Compiled {} template: {} bytes, {} placeholders, {} escaped",
                      Traits::NAME, m_text.size(), m_occurrences.size(), m_escapes.size());
    }

    const std::string& text() const { return m_text; }

    /**
     * All live occurrences, ordered by start offset
     */
    const std::vector<Occurrence<Kind>>& occurrences() const { return m_occurrences; }

    /**
     * Offsets of the backslashes of escaped placeholders, ascending
     */
    const std::vector<std::size_t>& escapes() const { return m_escapes; }

    bool contains(Kind kind) const { return m_present[valueIndex(kind)]; }

    std::size_t count(Kind kind) const {
        return static_cast<std::size_t>(std::count_if(m_occurrences.begin(), m_occurrences.end(),
            [kind](const Occurrence<Kind>& occ) { return occ.kind == kind; }));
    }

    /**
     * Compute the substitution value of every kind present in the template
     */
    Values resolve(const Context& context) const {
        Values values;
        for (const auto& spec : Traits::SPECS) {
            if (!contains(spec.kind)) {
                continue;
            }
            std::string raw = spec.value(context);
            values[valueIndex(spec.kind)] = spec.escape ? escapeHtml(raw) : std::move(raw);
        }
        return values;
    }

    /**
     * Exact length of assemble(values)
     * 
     * Template length, plus for every occurrence the value length minus
     * the placeholder literal length, minus one byte per escape.
     */
    std::size_t predictSize(const Values& values) const {
        std::size_t size = m_text.size();
        for (const auto& occ : m_occurrences) {
            size += values[valueIndex(occ.kind)].size();
            size -= occ.end - occ.start;
        }
        return size - m_escapes.size();
    }

    /**
     * Splice values into the template in one pass
     */
    std::string assemble(const Values& values) const {
        std::string output;
        output.reserve(predictSize(values));

        std::size_t last = 0;
        for (const auto& splice : m_splices) {
            output.append(m_text, last, splice.start - last);
            if (splice.slot < KIND_COUNT) {
                output.append(values[splice.slot]);
            }
            last = splice.end;
        }
        output.append(m_text, last, std::string::npos);

        return output;
    }

    std::string render(const Context& context) const {
        return assemble(resolve(context));
    }

private:
    // A byte range replaced during assembly; slot KIND_COUNT drops an escape backslash
    struct Splice {
        std::size_t start;
        std::size_t end;
        std::size_t slot;
    };

    static constexpr bool specsInKindOrder() {
        for (std::size_t i = 0; i < KIND_COUNT; ++i) {
            if (valueIndex(Traits::SPECS[i].kind) != i) {
                return false;
            }
        }
        return true;
    }

    void buildSplices() {
        m_splices.reserve(m_occurrences.size() + m_escapes.size());
        for (const auto& occ : m_occurrences) {
            m_splices.push_back({occ.start, occ.end, valueIndex(occ.kind)});
        }
        for (std::size_t pos : m_escapes) {
            m_splices.push_back({pos, pos + 1, KIND_COUNT});
        }
        std::sort(m_splices.begin(), m_splices.end(),
            [](const Splice& a, const Splice& b) { return a.start < b.start; });
    }

    std::string m_text;
    std::vector<Occurrence<Kind>> m_occurrences;
    std::vector<std::size_t> m_escapes;
    std::vector<Splice> m_splices;
    std::array<bool, KIND_COUNT> m_present{};
};

} // namespace noos
