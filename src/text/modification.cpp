/*
 * AI-Ghostline Line Modifications
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <ai-ghostline/text/modification.hpp>
#include <algorithm>

namespace ghostline {

MalformedPatch::MalformedPatch(std::size_t index, const std::string& reason)
    : std::runtime_error("malformed patch at modification " + std::to_string(index) + ": " + reason),
      m_index(index) {}

namespace {

struct RangeOf {
    LineRange operator()(const Insert& m) const { return {m.at_line, m.at_line}; }
    LineRange operator()(const Delete& m) const { return m.range; }
    LineRange operator()(const Replace& m) const { return m.range; }
};

struct DeltaOf {
    long operator()(const Insert& m) const { return static_cast<long>(m.new_lines.size()); }
    long operator()(const Delete& m) const { return -static_cast<long>(m.range.size()); }
    long operator()(const Replace& m) const {
        return static_cast<long>(m.new_lines.size()) - static_cast<long>(m.range.size());
    }
};

struct Describe {
    std::string operator()(const Insert& m) const {
        return "insert " + std::to_string(m.new_lines.size()) + " line(s) at " + std::to_string(m.at_line);
    }
    std::string operator()(const Delete& m) const {
        return "delete [" + std::to_string(m.range.start) + "," + std::to_string(m.range.end) + ")";
    }
    std::string operator()(const Replace& m) const {
        return "replace [" + std::to_string(m.range.start) + "," + std::to_string(m.range.end) + ") with "
            + std::to_string(m.new_lines.size()) + " line(s)";
    }
};

void validate(const Lines& lines, const Modifications& mods) {
    size_t cursor = 0; // first original line not yet claimed by an earlier modification
    for (size_t i = 0; i < mods.size(); ++i) {
        LineRange r = affected_range(mods[i]);
        if (r.start > r.end) throw MalformedPatch(i, "range start after end");
        if (r.end > lines.size()) {
            throw MalformedPatch(i, "range end " + std::to_string(r.end) + " beyond "
                + std::to_string(lines.size()) + " line(s)");
        }
        if (r.start < cursor) throw MalformedPatch(i, "overlaps or precedes previous modification");
        cursor = r.end;
    }
}

} // namespace

LineRange affected_range(const Modification& m) { return std::visit(RangeOf{}, m); }
long line_delta(const Modification& m) { return std::visit(DeltaOf{}, m); }
std::string describe(const Modification& m) { return std::visit(Describe{}, m); }

Lines apply_modifications(const Lines& lines, const Modifications& mods) {
    validate(lines, mods);
    long growth = 0;
    for (auto& m : mods) growth += line_delta(m);
    Lines out;
    out.reserve(static_cast<size_t>(std::max<long>(0, static_cast<long>(lines.size()) + growth)));
    size_t pos = 0;
    for (auto& m : mods) {
        LineRange r = affected_range(m);
        out.insert(out.end(), lines.begin() + pos, lines.begin() + r.start);
        if (auto* ins = std::get_if<Insert>(&m)) {
            out.insert(out.end(), ins->new_lines.begin(), ins->new_lines.end());
        } else if (auto* rep = std::get_if<Replace>(&m)) {
            out.insert(out.end(), rep->new_lines.begin(), rep->new_lines.end());
        }
        pos = r.end;
    }
    out.insert(out.end(), lines.begin() + pos, lines.end());
    return out;
}

Modifications diff_lines(const Lines& from, const Lines& to) {
    size_t prefix = 0;
    while (prefix < from.size() && prefix < to.size() && from[prefix] == to[prefix]) ++prefix;
    size_t suffix = 0;
    while (suffix < from.size() - prefix && suffix < to.size() - prefix
           && from[from.size() - 1 - suffix] == to[to.size() - 1 - suffix]) ++suffix;
    LineRange old_range{prefix, from.size() - suffix};
    Lines added(to.begin() + prefix, to.end() - suffix);
    Modifications mods;
    if (old_range.size() == 0 && added.empty()) return mods;
    if (old_range.size() == 0) mods.push_back(Insert{prefix, std::move(added)});
    else if (added.empty()) mods.push_back(Delete{old_range});
    else mods.push_back(Replace{old_range, std::move(added)});
    return mods;
}

} // namespace ghostline
