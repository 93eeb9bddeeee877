#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///     CLASH GRAPH     ///
///////////////////////////
/**
 * @brief Undirected graph of activities that must never overlap in time.
 *
 * Nodes are activity ids (section ids or exam ids, 0..N-1). Two nodes are
 * adjacent when they share an enrolled student or belong to the same
 * elective group. Built once per planning cycle; lookups are O(1).
 */
class ClashGraph {
public:
    /// Marker for edges without a witness student (elective siblings).
    static constexpr int kNoStudent = -1;

    /**
     * @brief Create a graph with `n` isolated nodes.
     */
    explicit ClashGraph(int n = 0);

    /**
     * @brief Build the section clash graph from enrollments and elective groups.
     */
    static ClashGraph forSections(const ProblemInstance& inst);

    /**
     * @brief Build the exam clash graph from exam student lists.
     */
    static ClashGraph forExams(const ExamProblem& problem);

    /**
     * @brief Add an undirected edge. Repeated edges keep the first witness.
     *
     * @param witness A student shared by both activities, or kNoStudent.
     */
    void addClash(int a, int b, int witness);

    /// True if `a` and `b` must not overlap.
    bool clashes(int a, int b) const { return matrix_[(size_t)a * n_ + b] != 0; }

    /// Sorted neighbours of `a`.
    const std::vector<int>& neighbours(int a) const { return adjacency_[a]; }

    /// Number of neighbours of `a`.
    int degree(int a) const { return (int)adjacency_[a].size(); }

    /// A student shared by `a` and `b`, or kNoStudent.
    int witness(int a, int b) const { return witness_[(size_t)a * n_ + b]; }

    /// Number of nodes.
    int size() const { return n_; }

private:
    int n_; ///< Node count.
    std::vector<char> matrix_; ///< n*n adjacency flags.
    std::vector<int> witness_; ///< n*n witness students.
    std::vector<std::vector<int>> adjacency_; ///< Sorted adjacency lists.
};
