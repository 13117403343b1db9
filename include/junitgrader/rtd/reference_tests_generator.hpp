#pragma once

#include <junitgrader/grading_session.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace junitgrader::rtd {

/// Creates the reference tests directory from checked out template repos.
///
/// For each assignment, copies every `*Test.java` file below `<template_dir>/<assignment>` into
/// `<reference_tests_dir>/<assignment>`, keeping the relative paths. Nothing is copied if any assignment already has
/// a directory in `reference_tests_dir`, or if any template is missing.
///
/// On success, returns one line per assignment listing the copied test classes.
GradingResult<std::string> generate_reference_tests_dir(const std::filesystem::path& reference_tests_dir,
                                                        const std::vector<std::string>& assignment_names,
                                                        const std::filesystem::path& template_dir);

} // namespace junitgrader::rtd
