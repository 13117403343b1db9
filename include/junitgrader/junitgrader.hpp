#pragma once

#include <junitgrader/grader_options.hpp>                // IWYU pragma: export
#include <junitgrader/grading_session.hpp>               // IWYU pragma: export
#include <junitgrader/java/compiler.hpp>                 // IWYU pragma: export
#include <junitgrader/java/java_source.hpp>              // IWYU pragma: export
#include <junitgrader/java/matcher.hpp>                  // IWYU pragma: export
#include <junitgrader/logging.hpp>                       // IWYU pragma: export
#include <junitgrader/output/report.hpp>                 // IWYU pragma: export
#include <junitgrader/pipeline.hpp>                      // IWYU pragma: export
#include <junitgrader/rtd/reference_tests_generator.hpp> // IWYU pragma: export
#include <junitgrader/runner/junit_runner.hpp>           // IWYU pragma: export
#include <junitgrader/runner/security_policy.hpp>        // IWYU pragma: export
