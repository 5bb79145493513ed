/// @file docpatch.hpp
/// @brief Umbrella header for the docpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Pointer, Operation, Document, PatchEngine, PatchValidator,
/// ContentHasher, AuditRecorder, EngineOptions, Logger, and the error types.
/// JSON interop lives in <docpatch-cpp/json.hpp>.

#pragma once

#include <docpatch-cpp/applier.hpp>
#include <docpatch-cpp/audit.hpp>
#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/engine.hpp>
#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/hasher.hpp>
#include <docpatch-cpp/inverse.hpp>
#include <docpatch-cpp/log.hpp>
#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/pointer.hpp>
#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/validator.hpp>
#include <docpatch-cpp/value.hpp>
#include <docpatch-cpp/version_guard.hpp>
