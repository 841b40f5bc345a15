// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "test-utils.h"
#include <fmt/core.h>
#include "fake-collaborators.h"
#include "utils/error_code.h"
#include "vcs/stack_orderer.h"
#include <algorithm>
#include <random>
#include <set>

namespace st = jjstack::test;

using namespace jjstack;
using namespace jjstack::vcs;

using names_t = model::names_t;

TEST_CASE("topology parsing", "[orderer]") {
    auto r = stack_orderer_t::parse_topology("c1\tfeat-a\nc2\t\nc3\tfeat-b  feat-c\ngarbage\n\tno-id\nc4\tfeat-d\r\n");
    REQUIRE(r.size() == 4);
    CHECK(r[0].id == "c1");
    CHECK(r[0].names == names_t{"feat-a"});
    CHECK(r[1].id == "c2");
    CHECK(r[1].names.empty());
    CHECK(r[2].names == names_t{"feat-b", "feat-c"});
    CHECK(r[3].names == names_t{"feat-d"});
}

TEST_CASE("linearize", "[orderer]") {
    auto topology = stack_orderer_t::parse_topology("c1\ttrunk-only\nc2\tfeat-a\nc3\tfeat-b feat-b2\nc4\tfeat-c\n");

    SECTION("ancestors first") {
        auto r = stack_orderer_t::linearize({"feat-c", "feat-a", "feat-b"}, topology);
        CHECK(r == names_t{"feat-a", "feat-b", "feat-c"});
    }

    SECTION("names on one commit keep the annotation order") {
        auto r = stack_orderer_t::linearize({"feat-b2", "feat-b"}, topology);
        CHECK(r == names_t{"feat-b", "feat-b2"});
    }

    SECTION("unknown names go last, in input order") {
        auto r = stack_orderer_t::linearize({"zeta", "feat-c", "alpha", "feat-a"}, topology);
        CHECK(r == names_t{"feat-a", "feat-c", "zeta", "alpha"});
    }

    SECTION("duplicates") {
        auto r = stack_orderer_t::linearize({"feat-c", "feat-c", "feat-a", "feat-c"}, topology);
        CHECK(r == names_t{"feat-a", "feat-c"});
    }

    SECTION("empty topology keeps the input order") {
        auto r = stack_orderer_t::linearize({"b", "a"}, {});
        CHECK(r == names_t{"b", "a"});
    }
}

TEST_CASE("stack orderer", "[orderer]") {
    auto vcs = st::fake_vcs_t({"feat-a", "feat-b", "feat-c"});
    auto orderer = stack_orderer_t(vcs, "trunk()");

    SECTION("one topology query") {
        auto r = orderer.order(names_t{"feat-c", "feat-b", "feat-a"});
        CHECK(r == names_t{"feat-a", "feat-b", "feat-c"});
        REQUIRE(vcs.count("log_topology") == 1);
        CHECK(vcs.calls[0].find("present(\"feat-c\")") != std::string::npos);
    }

    SECTION("empty input, no query") {
        CHECK(orderer.order(names_t{}).empty());
        CHECK(vcs.calls.empty());
    }

    SECTION("vcs failure degrades to the input order") {
        vcs.topology_error = utils::make_error_code(utils::error_code_t::collaborator_failure);
        auto r = orderer.order(names_t{"feat-c", "feat-a", "feat-c"});
        CHECK(r == names_t{"feat-c", "feat-a"});
    }

    SECTION("malformed output degrades") {
        vcs.topology = "this is not a topology\n";
        auto r = orderer.order(names_t{"feat-b", "feat-a"});
        CHECK(r == names_t{"feat-b", "feat-a"});
    }

    SECTION("branch absent from the topology goes last") {
        auto r = orderer.order(names_t{"gone", "feat-b", "feat-a"});
        CHECK(r == names_t{"feat-a", "feat-b", "gone"});
    }
}

namespace {

/* random acyclic graph: commit i may only have parents < i */
struct random_dag_t {
    using parents_t = std::vector<std::vector<std::size_t>>;

    random_dag_t(std::uint32_t seed, std::size_t commits) : rng{seed} {
        parents.resize(commits);
        for (std::size_t i = 1; i < commits; ++i) {
            auto count = std::uniform_int_distribution<std::size_t>(1, std::min<std::size_t>(2, i))(rng);
            for (std::size_t j = 0; j < count; ++j) {
                parents[i].push_back(std::uniform_int_distribution<std::size_t>(0, i - 1)(rng));
            }
        }
        names.resize(commits);
        for (std::size_t i = 0; i < commits; ++i) {
            auto count = std::uniform_int_distribution<int>(0, 2)(rng);
            for (int j = 0; j < count; ++j) {
                names[i].push_back(fmt::format("b{}-{}", i, j));
            }
        }
    }

    bool is_ancestor(std::size_t ancestor, std::size_t descendant) const {
        if (ancestor >= descendant) {
            return false;
        }
        auto stack = std::vector<std::size_t>{descendant};
        auto seen = std::set<std::size_t>{};
        while (!stack.empty()) {
            auto c = stack.back();
            stack.pop_back();
            for (auto p : parents[c]) {
                if (p == ancestor) {
                    return true;
                }
                if (seen.insert(p).second) {
                    stack.push_back(p);
                }
            }
        }
        return false;
    }

    /* a topological order (ancestors first) which is not the index order */
    std::string topology() {
        std::vector<std::size_t> order;
        std::vector<std::size_t> pending(parents.size());
        std::vector<std::vector<std::size_t>> children(parents.size());
        for (std::size_t i = 0; i < parents.size(); ++i) {
            auto unique_parents = std::set<std::size_t>(parents[i].begin(), parents[i].end());
            pending[i] = unique_parents.size();
            for (auto p : unique_parents) {
                children[p].push_back(i);
            }
        }
        std::vector<std::size_t> ready;
        for (std::size_t i = 0; i < parents.size(); ++i) {
            if (!pending[i]) {
                ready.push_back(i);
            }
        }
        while (!ready.empty()) {
            auto pick = std::uniform_int_distribution<std::size_t>(0, ready.size() - 1)(rng);
            auto c = ready[pick];
            ready.erase(ready.begin() + pick);
            order.push_back(c);
            for (auto child : children[c]) {
                if (!--pending[child]) {
                    ready.push_back(child);
                }
            }
        }
        std::string r;
        for (auto c : order) {
            r += fmt::format("c{}\t", c);
            for (std::size_t j = 0; j < names[c].size(); ++j) {
                r += (j ? " " : "") + names[c][j];
            }
            r += '\n';
        }
        return r;
    }

    std::size_t commit_of(const std::string &name) const {
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (std::find(names[i].begin(), names[i].end(), name) != names[i].end()) {
                return i;
            }
        }
        return names.size();
    }

    std::mt19937 rng;
    parents_t parents;
    std::vector<names_t> names;
};

} // namespace

TEST_CASE("orderer respects ancestry of random graphs", "[orderer]") {
    for (std::uint32_t seed = 1; seed <= 50; ++seed) {
        INFO("seed " << seed);
        auto dag = random_dag_t(seed, 4 + seed % 20);
        auto all = names_t{};
        for (auto &names : dag.names) {
            all.insert(all.end(), names.begin(), names.end());
        }

        auto subset = names_t{};
        for (auto &name : all) {
            if (std::uniform_int_distribution<int>(0, 2)(dag.rng)) {
                subset.push_back(name);
            }
        }
        std::shuffle(subset.begin(), subset.end(), dag.rng);
        // some names unknown to the graph
        subset.push_back(fmt::format("missing-{}", seed));
        if (!subset.empty() && seed % 3 == 0) {
            subset.push_back(subset.front());
        }

        auto topology = stack_orderer_t::parse_topology(dag.topology());
        auto r = stack_orderer_t::linearize(subset, topology);

        auto expected = model::unique(subset);
        REQUIRE(r.size() == expected.size());
        CHECK(std::set<std::string>(r.begin(), r.end()) == std::set<std::string>(expected.begin(), expected.end()));
        CHECK(r.back() == fmt::format("missing-{}", seed));

        for (std::size_t i = 0; i < r.size(); ++i) {
            for (std::size_t j = i + 1; j < r.size(); ++j) {
                auto ci = dag.commit_of(r[i]);
                auto cj = dag.commit_of(r[j]);
                if (ci < dag.names.size() && cj < dag.names.size()) {
                    INFO(r[i] << " precedes " << r[j]);
                    CHECK(!dag.is_ancestor(cj, ci));
                }
            }
        }
    }
}
