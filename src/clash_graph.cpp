///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "clash_graph.hpp"
#include <algorithm>
#include <map>


///////////////////////////
///     CLASH GRAPH     ///
///////////////////////////
ClashGraph::ClashGraph(int n)
        : n_(n),
          matrix_((size_t)n * n, 0),
          witness_((size_t)n * n, kNoStudent),
          adjacency_(n) {}

/**
 * @brief Record that two activities must never overlap.
 *
 * Self-edges are ignored. Adjacency lists are kept sorted so neighbour
 * iteration order does not depend on insertion order.
 */
void ClashGraph::addClash(int a, int b, int witness) {
    if (a == b) return;
    size_t ab = (size_t)a * n_ + b;
    size_t ba = (size_t)b * n_ + a;
    if (matrix_[ab]) {
        // Upgrade an elective-only edge with a student witness for diagnostics.
        if (witness_[ab] == kNoStudent && witness != kNoStudent) {
            witness_[ab] = witness;
            witness_[ba] = witness;
        }
        return;
    }
    matrix_[ab] = 1;
    matrix_[ba] = 1;
    witness_[ab] = witness;
    witness_[ba] = witness;

    auto insertSorted = [](std::vector<int>& list, int value) {
        list.insert(std::lower_bound(list.begin(), list.end(), value), value);
    };
    insertSorted(adjacency_[a], b);
    insertSorted(adjacency_[b], a);
}

/**
 * @brief Build the section clash graph.
 *
 * Every pair of sections sharing an enrolled student is connected, with the
 * lowest-id shared student as witness; every pair of sections in the same
 * elective group is connected without a witness.
 */
ClashGraph ClashGraph::forSections(const ProblemInstance& inst) {
    int n = (int)inst.sections.size();
    ClashGraph graph(n);

    // Students are visited in id order, so the first witness is the lowest id.
    for (const Student& st : inst.students) {
        const std::vector<int>& secs = st.sectionIds;
        for (size_t i = 0; i < secs.size(); ++i) {
            for (size_t j = i + 1; j < secs.size(); ++j) {
                if (secs[i] < 0 || secs[i] >= n || secs[j] < 0 || secs[j] >= n) continue;
                graph.addClash(secs[i], secs[j], st.id);
            }
        }
    }

    std::map<int, std::vector<int>> electiveGroups;
    for (const Section& s : inst.sections) {
        if (s.electiveGroup >= 0) electiveGroups[s.electiveGroup].push_back(s.id);
    }
    for (const auto& entry : electiveGroups) {
        const std::vector<int>& members = entry.second;
        for (size_t i = 0; i < members.size(); ++i)
            for (size_t j = i + 1; j < members.size(); ++j)
                graph.addClash(members[i], members[j], kNoStudent);
    }
    return graph;
}

/**
 * @brief Build the exam clash graph: exams sharing a student never overlap.
 */
ClashGraph ClashGraph::forExams(const ExamProblem& problem) {
    int n = (int)problem.exams.size();
    ClashGraph graph(n);

    // student id -> exams taken, in exam id order
    std::map<int, std::vector<int>> examsByStudent;
    for (const Exam& e : problem.exams) {
        for (int st : e.studentIds) examsByStudent[st].push_back(e.id);
    }
    for (const auto& entry : examsByStudent) {
        const std::vector<int>& exams = entry.second;
        for (size_t i = 0; i < exams.size(); ++i)
            for (size_t j = i + 1; j < exams.size(); ++j)
                graph.addClash(exams[i], exams[j], entry.first);
    }
    return graph;
}
