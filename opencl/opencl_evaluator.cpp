///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

/// Fixed limits of the kernel's private occupancy arrays.
static const int kMaxDays = 7;
static const int kMaxPeriods = 16;

/// Ints written per candidate: the fields of SoftTermCounts in order.
static const int kTermsPerCandidate = 6;

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* SCHEDULE_KERNEL_SRC = R"(
#define MAX_DAYS 7
#define MAX_PERIODS 16

// Idle non-break periods between the first and last busy period of each day.
int count_gaps(int occ[MAX_DAYS][MAX_PERIODS], __global const int* isBreak, int days, int periods) {
    int gaps = 0;
    for (int d = 0; d < days; ++d) {
        int first = -1, last = -1;
        for (int p = 0; p < periods; ++p) {
            if (occ[d][p]) {
                if (first < 0) first = p;
                last = p;
            }
        }
        for (int p = first + 1; first >= 0 && p < last; ++p) {
            if (!occ[d][p] && !isBreak[p]) gaps++;
        }
    }
    return gaps;
}

__kernel void score_timetables(
    __global const int* days,               // numCandidates * numSections
    __global const int* starts,             // numCandidates * numSections
    __global const int* faculty,            // numCandidates * numSections
    const int numCandidates,
    const int numSections,
    const int numStudents,
    const int numFaculty,
    const int daysPerWeek,
    const int periodsPerDay,
    const int selfStudyPeriods,
    __global const int* durations,          // numSections
    __global const int* studentOffsets,     // numStudents + 1
    __global const int* studentSections,    // flat section ids
    __global const int* isBreak,            // periodsPerDay
    __global int* termsOut                  // numCandidates * 6
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    int base = cid * numSections;
    int occ[MAX_DAYS][MAX_PERIODS];

    int studentGaps = 0, missingBreaks = 0, missingSelfStudy = 0;
    for (int st = 0; st < numStudents; ++st) {
        for (int d = 0; d < daysPerWeek; ++d)
            for (int p = 0; p < periodsPerDay; ++p)
                occ[d][p] = 0;

        int from = studentOffsets[st];
        int to = studentOffsets[st + 1];
        for (int i = from; i < to; ++i) {
            int s = studentSections[i];
            int d = days[base + s];
            if (d < 0) continue;
            for (int k = 0; k < durations[s]; ++k) occ[d][starts[base + s] + k] = 1;
        }

        studentGaps += count_gaps(occ, isBreak, daysPerWeek, periodsPerDay);

        // Class blocks ending right where another class starts.
        for (int i = from; i < to; ++i) {
            int s = studentSections[i];
            int d = days[base + s];
            if (d < 0) continue;
            int end = starts[base + s] + durations[s];
            if (end < periodsPerDay && occ[d][end]) missingBreaks++;
        }

        // Busy days without a free run of selfStudyPeriods non-break periods.
        for (int d = 0; d < daysPerWeek; ++d) {
            int busy = 0, run = 0, longest = 0;
            for (int p = 0; p < periodsPerDay; ++p) {
                if (occ[d][p]) busy = 1;
                if (occ[d][p] || isBreak[p]) {
                    run = 0;
                } else {
                    run++;
                    if (run > longest) longest = run;
                }
            }
            if (busy && longest < selfStudyPeriods) missingSelfStudy++;
        }
    }

    int facultyGaps = 0, loadSum = 0, loadSumSquares = 0;
    for (int f = 0; f < numFaculty; ++f) {
        for (int d = 0; d < daysPerWeek; ++d)
            for (int p = 0; p < periodsPerDay; ++p)
                occ[d][p] = 0;

        int load = 0;
        for (int s = 0; s < numSections; ++s) {
            int d = days[base + s];
            if (d < 0 || faculty[base + s] != f) continue;
            for (int k = 0; k < durations[s]; ++k) occ[d][starts[base + s] + k] = 1;
            load += durations[s];
        }
        facultyGaps += count_gaps(occ, isBreak, daysPerWeek, periodsPerDay);
        loadSum += load;
        loadSumSquares += load * load;
    }

    int out = cid * 6;
    termsOut[out + 0] = studentGaps;
    termsOut[out + 1] = facultyGaps;
    termsOut[out + 2] = missingBreaks;
    termsOut[out + 3] = missingSelfStudy;
    termsOut[out + 4] = loadSum;
    termsOut[out + 5] = loadSumSquares;
}
)";

///////////////////////////
///     SOFT TERMS      ///
///////////////////////////
double SoftTermCounts::cost(const SoftWeights& weights, int numFaculty) const {
    double variance = 0.0;
    if (numFaculty > 0) {
        double mean = (double)loadSum / numFaculty;
        variance = (double)loadSumSquares / numFaculty - mean * mean;
        if (variance < 0.0) variance = 0.0;
    }
    return weights.gapPenalty * (studentGaps + facultyGaps) +
           weights.imbalancePenalty * variance +
           weights.selfStudyBonus * missingSelfStudy +
           weights.breakBonus * missingBreaks;
}

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
ScheduleOpenCLContext::ScheduleOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        std::cerr << "No GPU found, trying CPU...\n";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    std::cerr << "Using OpenCL device: " << name << "\n";

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    queue = clCreateCommandQueue(context, device, 0, &err);
    checkError(err, "creating command queue");

    program = buildProgram(SCHEDULE_KERNEL_SRC);
}

ScheduleOpenCLContext::~ScheduleOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program ScheduleOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, 0);
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        std::cerr << "OpenCL build log:\n" << log.data() << "\n";
        clReleaseProgram(prog);
        checkError(err, "building program");
    }

    return prog;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
/**
 * @brief Device buffer released when it leaves scope.
 */
struct DeviceBuffer {
    cl_mem mem = nullptr;

    DeviceBuffer(cl_context context, cl_mem_flags flags, size_t bytes, const char* name) {
        cl_int err = CL_SUCCESS;
        mem = clCreateBuffer(context, flags, bytes > 0 ? bytes : sizeof(int), nullptr, &err);
        checkError(err, name);
    }
    ~DeviceBuffer() {
        if (mem) clReleaseMemObject(mem);
    }
    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;
};

static void upload(cl_command_queue queue, const DeviceBuffer& buf, const std::vector<int>& data, const char* name) {
    if (data.empty()) return;
    cl_int err = clEnqueueWriteBuffer(queue, buf.mem, CL_TRUE, 0, data.size() * sizeof(int), data.data(),
                                      0, nullptr, nullptr);
    checkError(err, name);
}

void ScheduleOpenCLContext::evaluateBatch(const ProblemInstance& inst, int selfStudyPeriods,
                                          const std::vector<std::vector<Assignment>>& batch,
                                          std::vector<SoftTermCounts>& counts) {
    cl_int err = CL_SUCCESS;

    int numCandidates = (int)batch.size();
    counts.assign(numCandidates, SoftTermCounts());
    if (numCandidates == 0) return;

    int numSections = (int)inst.sections.size();
    int numStudents = (int)inst.students.size();
    int numFaculty = (int)inst.faculty.size();
    int daysPerWeek = inst.grid.days;
    int periodsPerDay = inst.grid.periodsPerDay;
    if (daysPerWeek > kMaxDays || periodsPerDay > kMaxPeriods)
        throw std::runtime_error("OpenCL scoring supports at most 7 days of 16 periods");

    // Flatten candidates; unassigned sections carry day -1.
    std::vector<int> days((size_t)numCandidates * numSections, -1);
    std::vector<int> starts((size_t)numCandidates * numSections, 0);
    std::vector<int> faculty((size_t)numCandidates * numSections, -1);
    for (int c = 0; c < numCandidates; ++c) {
        for (int s = 0; s < numSections; ++s) {
            const Assignment& a = batch[c][s];
            if (!a.assigned()) continue;
            size_t idx = (size_t)c * numSections + s;
            days[idx] = a.day;
            starts[idx] = a.startPeriod;
            faculty[idx] = a.facultyId;
        }
    }

    // Instance data: durations, student -> sections (CSR layout), break flags.
    std::vector<int> durations(numSections);
    for (int s = 0; s < numSections; ++s) durations[s] = inst.sections[s].duration;

    std::vector<int> studentOffsets(numStudents + 1);
    std::vector<int> studentSections;
    int offset = 0;
    for (int st = 0; st < numStudents; ++st) {
        studentOffsets[st] = offset;
        for (int sid : inst.students[st].sectionIds) {
            studentSections.push_back(sid);
            ++offset;
        }
    }
    studentOffsets[numStudents] = offset;

    std::vector<int> isBreak(periodsPerDay);
    for (int p = 0; p < periodsPerDay; ++p) isBreak[p] = inst.grid.isBreak(p) ? 1 : 0;

    size_t candidateBytes = days.size() * sizeof(int);
    DeviceBuffer d_days(context, CL_MEM_READ_ONLY, candidateBytes, "creating d_days");
    DeviceBuffer d_starts(context, CL_MEM_READ_ONLY, candidateBytes, "creating d_starts");
    DeviceBuffer d_faculty(context, CL_MEM_READ_ONLY, candidateBytes, "creating d_faculty");
    DeviceBuffer d_durations(context, CL_MEM_READ_ONLY, durations.size() * sizeof(int), "creating d_durations");
    DeviceBuffer d_offsets(context, CL_MEM_READ_ONLY, studentOffsets.size() * sizeof(int), "creating d_offsets");
    DeviceBuffer d_sections(context, CL_MEM_READ_ONLY, studentSections.size() * sizeof(int), "creating d_sections");
    DeviceBuffer d_breaks(context, CL_MEM_READ_ONLY, isBreak.size() * sizeof(int), "creating d_breaks");
    size_t termBytes = (size_t)numCandidates * kTermsPerCandidate * sizeof(int);
    DeviceBuffer d_terms(context, CL_MEM_WRITE_ONLY, termBytes, "creating d_terms");

    // Upload data
    upload(queue, d_days, days, "writing d_days");
    upload(queue, d_starts, starts, "writing d_starts");
    upload(queue, d_faculty, faculty, "writing d_faculty");
    upload(queue, d_durations, durations, "writing d_durations");
    upload(queue, d_offsets, studentOffsets, "writing d_offsets");
    upload(queue, d_sections, studentSections, "writing d_sections");
    upload(queue, d_breaks, isBreak, "writing d_breaks");

    // Kernel + args
    cl_kernel kernel = clCreateKernel(program, "score_timetables", &err);
    checkError(err, "creating kernel");

    try {
        int arg = 0;
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_days.mem); checkError(err, "arg days");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_starts.mem); checkError(err, "arg starts");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_faculty.mem); checkError(err, "arg faculty");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numSections); checkError(err, "arg numSections");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numStudents); checkError(err, "arg numStudents");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numFaculty); checkError(err, "arg numFaculty");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &daysPerWeek); checkError(err, "arg daysPerWeek");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &periodsPerDay); checkError(err, "arg periodsPerDay");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &selfStudyPeriods); checkError(err, "arg selfStudyPeriods");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_durations.mem); checkError(err, "arg durations");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_offsets.mem); checkError(err, "arg studentOffsets");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_sections.mem); checkError(err, "arg studentSections");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_breaks.mem); checkError(err, "arg isBreak");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_terms.mem); checkError(err, "arg termsOut");

        size_t global = (size_t)numCandidates;
        err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing score_timetables");
        err = clFinish(queue);
        checkError(err, "finishing queue");

        std::vector<int> terms((size_t)numCandidates * kTermsPerCandidate);
        err = clEnqueueReadBuffer(queue, d_terms.mem, CL_TRUE, 0, termBytes, terms.data(), 0, nullptr, nullptr);
        checkError(err, "reading terms");

        for (int c = 0; c < numCandidates; ++c) {
            const int* t = &terms[(size_t)c * kTermsPerCandidate];
            counts[c].studentGaps = t[0];
            counts[c].facultyGaps = t[1];
            counts[c].missingBreaks = t[2];
            counts[c].missingSelfStudy = t[3];
            counts[c].loadSum = t[4];
            counts[c].loadSumSquares = t[5];
        }
    } catch (const std::runtime_error&) {
        clReleaseKernel(kernel);
        throw;
    }
    clReleaseKernel(kernel);
}
