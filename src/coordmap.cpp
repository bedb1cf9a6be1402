#include "../include/coordmap.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <utility>

namespace coordmap {

const char* kind_name(MapKind k) {
    switch (k) {
        case MapKind::Exact:    return "exact";
        case MapKind::Upstream: return "upstream";
        case MapKind::PastEnd:  return "past_end";
        case MapKind::Unmapped: return "unmapped";
    }
    return "?";
}

// ------------------------- building -------------------------
void CoordMapper::add(const aln::Alignment& a) {
    const std::string* rows[2]  = {&a.a_row, &a.b_row};
    const std::string* names[2] = {&a.a_name, &a.b_name};

    if (a.a_name == a.b_name) {
        throw tblift::ParseError("", 0, a.a_name, "sequence aligned against itself under the same name");
    }

    Pair P;
    for (int s = 0; s < 2; ++s) {
        const std::string& row = *rows[s];
        Side& S = P.side[s];
        S.cum.resize(row.size());
        uint32_t n = 0;
        for (size_t c = 0; c < row.size(); ++c) {
            if (row[c] != '-') {
                ++n;
                S.pos2col.push_back((uint32_t)c);
            }
            S.cum[c] = n;
        }
        S.len = n;

        auto it = name2id_.find(*names[s]);
        if (it != name2id_.end() && lens_[it->second] != n) {
            throw tblift::ParseError("", 0, *names[s],
                "sequence length " + std::to_string(n) + " disagrees with an earlier alignment (" +
                std::to_string(lens_[it->second]) + ")");
        }
    }

    auto ia = name2id_.find(a.a_name);
    auto ib = name2id_.find(a.b_name);
    if (ia != name2id_.end() && ib != name2id_.end()) {
        for (const Hop& h : adj_[ia->second]) {
            if (pairs_[h.pair].id[1 - h.src] == ib->second) {
                throw tblift::ParseError("", 0, a.a_name + " vs " + a.b_name, "pair aligned more than once");
            }
        }
    }

    // validated; register new names
    for (int s = 0; s < 2; ++s) {
        auto it = name2id_.find(*names[s]);
        if (it != name2id_.end()) {
            P.id[s] = it->second;
            continue;
        }
        const uint32_t id = (uint32_t)names_.size();
        name2id_.emplace(*names[s], id);
        names_.push_back(*names[s]);
        lens_.push_back(P.side[s].len);
        adj_.emplace_back();
        P.id[s] = id;
    }

    const uint32_t pid = (uint32_t)pairs_.size();
    adj_[P.id[0]].push_back(Hop{pid, 0});
    adj_[P.id[1]].push_back(Hop{pid, 1});
    pairs_.push_back(std::move(P));

    debug_stream() << "alignment " << a.a_name << " (" << lens_[pairs_.back().id[0]] << " bp) vs "
                   << a.b_name << " (" << lens_[pairs_.back().id[1]] << " bp), " << a.n_cols() << " columns\n";
}

// ------------------------- lookups -------------------------
uint32_t CoordMapper::seq_id_(std::string_view name) const {
    auto it = name2id_.find(std::string(name));
    if (it == name2id_.end()) throw tblift::NoAlignment(std::string(name), "any sequence");
    return it->second;
}

uint32_t CoordMapper::seq_length(std::string_view name) const {
    return lens_[seq_id_(name)];
}

std::vector<std::string> CoordMapper::partners(std::string_view name) const {
    std::vector<std::string> out;
    for (const Hop& h : adj_[seq_id_(name)]) out.push_back(names_[pairs_[h.pair].id[1 - h.src]]);
    return out;
}

// BFS over alignments; shortest chain with at most max_hops_ alignments
bool CoordMapper::find_route_(uint32_t from, uint32_t to, std::vector<Hop>& path) const {
    path.clear();
    if (from == to) return true;

    const uint32_t NONE = UINT32_MAX;
    std::vector<uint32_t> prev_seq(names_.size(), NONE);
    std::vector<Hop>      prev_hop(names_.size());
    std::vector<int>      depth(names_.size(), -1);

    std::vector<uint32_t> q{from};
    depth[from] = 0;
    for (size_t qi = 0; qi < q.size() && depth[to] < 0; ++qi) {
        const uint32_t cur = q[qi];
        if (depth[cur] >= max_hops_) continue;
        for (const Hop& h : adj_[cur]) {
            const uint32_t nxt = pairs_[h.pair].id[1 - h.src];
            if (depth[nxt] >= 0) continue;
            depth[nxt]    = depth[cur] + 1;
            prev_seq[nxt] = cur;
            prev_hop[nxt] = h;
            q.push_back(nxt);
        }
    }
    if (depth[to] < 0) return false;

    for (uint32_t s = to; s != from; s = prev_seq[s]) path.push_back(prev_hop[s]);
    std::reverse(path.begin(), path.end());
    return true;
}

std::vector<CoordMapper::Hop> CoordMapper::route_(uint32_t from, uint32_t to) const {
    std::vector<Hop> path;
    if (!find_route_(from, to, path)) throw tblift::NoAlignment(names_[from], names_[to]);
    return path;
}

bool CoordMapper::joined(std::string_view a, std::string_view b) const {
    auto ia = name2id_.find(std::string(a));
    auto ib = name2id_.find(std::string(b));
    if (ia == name2id_.end() || ib == name2id_.end()) return false;
    std::vector<Hop> path;
    return find_route_(ia->second, ib->second, path);
}

MappedPos CoordMapper::hop_point_(const Hop& h, uint32_t pos) const {
    const Side& S = pairs_[h.pair].side[h.src];
    const Side& T = pairs_[h.pair].side[1 - h.src];
    const uint32_t col = S.pos2col[pos - 1];
    const uint32_t n = T.cum[col];

    if (T.has_base(col)) return MappedPos{n, MapKind::Exact};
    if (n == 0)          return MappedPos{0, MapKind::Unmapped};
    if (n == T.len)      return MappedPos{n, MapKind::PastEnd};
    return MappedPos{n, MapKind::Upstream};
}

bool CoordMapper::hop_span_(const Hop& h, uint32_t lo, uint32_t hi, uint32_t& first, uint32_t& last) const {
    const Side& S = pairs_[h.pair].side[h.src];
    const Side& T = pairs_[h.pair].side[1 - h.src];
    const uint32_t cl = S.pos2col[lo - 1];
    const uint32_t ch = S.pos2col[hi - 1];
    first = T.before(cl) + 1;
    last  = T.cum[ch];
    return first <= last;
}

// ------------------------- queries -------------------------
MappedPos CoordMapper::map_point(std::string_view from, std::string_view to, uint32_t pos) const {
    const uint32_t f = seq_id_(from);
    const uint32_t t = seq_id_(to);
    if (pos == 0 || pos > lens_[f]) throw tblift::OutOfRange(names_[f], pos, lens_[f]);
    if (f == t) return MappedPos{pos, MapKind::Exact};

    MappedPos cur{pos, MapKind::Exact};
    for (const Hop& h : route_(f, t)) {
        MappedPos nxt = hop_point_(h, cur.pos);
        nxt.kind = worst(cur.kind, nxt.kind);
        cur = nxt;
        if (cur.kind == MapKind::Unmapped) break;
    }
    if (cur.kind == MapKind::Unmapped) cur.pos = 0;
    // past the end of an intermediate sequence is past the end of the target
    if (cur.kind == MapKind::PastEnd) cur.pos = lens_[t];
    return cur;
}

MappedPos CoordMapper::map_point(std::string_view from, uint32_t pos) const {
    const uint32_t f = seq_id_(from);
    if (adj_[f].size() != 1) throw tblift::NoAlignment(names_[f], adj_[f].empty() ? "any sequence" : "a unique partner");
    const Hop& h = adj_[f][0];
    return map_point(from, names_[pairs_[h.pair].id[1 - h.src]], pos);
}

IntervalHit CoordMapper::map_interval(std::string_view from, std::string_view to, uint32_t lo, uint32_t hi) const {
    if (lo > hi) std::swap(lo, hi);
    const uint32_t f = seq_id_(from);
    const uint32_t t = seq_id_(to);
    if (lo == 0 || hi > lens_[f]) throw tblift::OutOfRange(names_[f], lo == 0 ? lo : hi, lens_[f]);

    IntervalHit H;
    H.src_len     = hi - lo + 1;
    H.tgt_seq_len = lens_[t];
    H.lo = map_point(from, to, lo);
    H.hi = map_point(from, to, hi);

    if (f == t) {
        H.first = lo; H.last = hi; H.n_target = H.src_len;
        return H;
    }

    uint32_t first = lo, last = hi;
    for (const Hop& h : route_(f, t)) {
        if (!hop_span_(h, first, last, first, last)) return H;  // deleted somewhere along the chain
    }
    H.first    = first;
    H.last     = last;
    H.n_target = last - first + 1;
    return H;
}

} // namespace coordmap
