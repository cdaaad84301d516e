/// @file Config.hpp
/// @brief Compile-time configuration and capability macros for Spindle::Execution.
#pragma once

// Stackful fibers use the hand-written context switch, available for Linux on x86_64 and AArch64.
#if defined(__linux__) && (defined(__x86_64__) || defined(__aarch64__)) && (defined(__GNUC__) || defined(__clang__))
#ifndef SPINDLE_EXECUTION_HAS_STACKFUL_FIBERS
#define SPINDLE_EXECUTION_HAS_STACKFUL_FIBERS 1
#endif
#else
#ifndef SPINDLE_EXECUTION_HAS_STACKFUL_FIBERS
#define SPINDLE_EXECUTION_HAS_STACKFUL_FIBERS 0
#endif
#endif

// Context layout identifiers (compile-time selection).
//
// FULL saves every callee-saved integer register of the platform ABI inside the switch routine.
// MINIMAL saves only the stack pointer, resume address, frame pointer and one base register, and
// declares the remaining callee-saved integer registers clobbered at the call site so the compiler
// spills only what is live.
#define SPINDLE_FIBER_CONTEXT_LAYOUT_FULL 1
#define SPINDLE_FIBER_CONTEXT_LAYOUT_MINIMAL 2

#ifndef SPINDLE_FIBER_CONTEXT_LAYOUT
#define SPINDLE_FIBER_CONTEXT_LAYOUT SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
#endif

#if (SPINDLE_FIBER_CONTEXT_LAYOUT != SPINDLE_FIBER_CONTEXT_LAYOUT_FULL) && (SPINDLE_FIBER_CONTEXT_LAYOUT != SPINDLE_FIBER_CONTEXT_LAYOUT_MINIMAL)
#error "SPINDLE_FIBER_CONTEXT_LAYOUT must be SPINDLE_FIBER_CONTEXT_LAYOUT_FULL or SPINDLE_FIBER_CONTEXT_LAYOUT_MINIMAL."
#endif

// Resume/yield state-tag checks that turn reentrant use into ReentrancyError instead of undefined behavior.
#ifndef SPINDLE_FIBER_REENTRANCY_CHECKS
#define SPINDLE_FIBER_REENTRANCY_CHECKS 1
#endif

