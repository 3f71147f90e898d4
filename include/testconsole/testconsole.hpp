#pragma once

// Everything needed to write test classes for testconsole

#include <testconsole/exceptions.hpp>                 // IWYU pragma: export
#include <testconsole/framework/test_class.hpp>       // IWYU pragma: export
#include <testconsole/registry/test_macros.hpp>       // IWYU pragma: export
#include <testconsole/registry/test_registry.hpp>     // IWYU pragma: export
#include <testconsole/version.hpp>                    // IWYU pragma: export
