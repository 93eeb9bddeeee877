///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_solver.hpp"
#include "exam_scheduler.hpp"
#include "model.hpp"
#include "config.hpp"
#include "evaluator.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "repository.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for exam scheduling.
 *
 * Solves and commits the teaching timetable of a demo instance, then places
 * its exams around that timetable, seats every student, assigns invigilators
 * and commits the exam schedule alongside it.
 */
int main(int argc, char** argv) {
    // No command-line handling yet.
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::M);
    ExamProblem exams = makeDemoExamProblem(inst);

    SolverConfig solverConfig;
    solverConfig.moveBudget = 1000;
    SequentialTimetableSolver solver;
    SolveResult teaching = solver.solve(inst, solverConfig);
    if (!teaching.feasible()) {
        std::cout << "No teaching timetable to schedule exams around.\n";
        printFailure(teaching.failure);
        return 1;
    }

    ScheduleRepository repository;
    long teachingCycle = repository.commit(inst, *teaching.solution);

    // Two invigilators for every 40 students, instructors only as a last resort.
    ExamConfig config;
    config.studentsPerInvigilator = 40;
    config.precedence = ExclusionPrecedence::MINIMUM_FIRST;
    config.verbose = true;

    ExamScheduler scheduler;
    auto start = std::chrono::high_resolution_clock::now();
    ExamResult result = scheduler.schedule(inst, exams, &*teaching.solution, config);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "========================================\n";
    std::cout << "EXAM SCHEDULER\n";
    std::cout << "Exams: " << exams.exams.size() << "\n";
    std::cout << "Time: " << ms << " ms\n";

    if (!result.feasible()) {
        std::cout << "No valid exam schedule found.\n";
        printFailure(result.failure);
        std::cout << "========================================\n";
        return 1;
    }

    const ExamSchedule& schedule = *result.schedule;
    std::cout << "Valid exam schedule found, soft cost = " << schedule.softCost << "\n\n";
    printExamSchedule(inst, exams, schedule);

    long examCycle = repository.commit(inst, *teaching.solution, exams, schedule, config);
    std::cout << "\nCommitted cycles " << teachingCycle << " (teaching) and " << examCycle << " (exams)\n";

    // Where the first student sits each exam.
    const Student& st = inst.students.front();
    std::cout << "\nSeats of " << st.name << ":\n";
    for (const SeatAssignment& seat : repository.seatsForStudent(examCycle, st.id))
        std::cout << "  " << exams.exams[seat.examId].name << ": " << seat.seatLabel << "\n";

    std::cout << "========================================\n";
    return 0;
}
