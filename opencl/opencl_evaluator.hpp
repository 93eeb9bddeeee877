#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "model.hpp"
#include "config.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief Unweighted soft-term counts of one candidate timetable.
 */
struct SoftTermCounts {
    int studentGaps = 0; ///< Idle periods inside student days.
    int facultyGaps = 0; ///< Idle periods inside faculty days.
    int missingBreaks = 0; ///< Student class blocks followed directly by another class.
    int missingSelfStudy = 0; ///< Student-days without a free self-study run.
    int loadSum = 0; ///< Sum of faculty loads.
    int loadSumSquares = 0; ///< Sum of squared faculty loads.

    /**
     * @brief Weighted soft cost, matching the CPU evaluator up to rounding.
     */
    double cost(const SoftWeights& weights, int numFaculty) const;
};

/**
 * @brief OpenCL helper context for batched timetable scoring.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * used to compute the soft terms of many complete timetables in parallel.
 * Hard constraints are not checked on the device.
 */
class ScheduleOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the program containing the scoring kernel.
     *
     * @throws std::runtime_error naming the failing OpenCL call and its error code.
     */
    ScheduleOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~ScheduleOpenCLContext();

    ScheduleOpenCLContext(const ScheduleOpenCLContext&) = delete;
    ScheduleOpenCLContext& operator=(const ScheduleOpenCLContext&) = delete;

    /**
     * @brief Score a batch of complete timetables on the device.
     *
     * Each element of `batch` holds one assignment per section, indexed by
     * section id. On return `counts[i]` holds the term counts of candidate i.
     *
     * @throws std::runtime_error on any OpenCL failure, or if the grid exceeds
     *         the kernel's fixed limits.
     */
    void evaluateBatch(const ProblemInstance& inst, int selfStudyPeriods,
                       const std::vector<std::vector<Assignment>>& batch, std::vector<SoftTermCounts>& counts);

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
};
