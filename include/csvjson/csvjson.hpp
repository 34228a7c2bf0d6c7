#pragma once

/// Convenience umbrella header for the csvjson library.

#include <csvjson/convert.hpp>
#include <csvjson/core/value.hpp>
#include <csvjson/parser/diagnostics.hpp>
#include <csvjson/parser/parser.hpp>
#include <csvjson/parser/separator.hpp>
#include <csvjson/table/header.hpp>
#include <csvjson/table/records.hpp>
#include <csvjson/table/transpose.hpp>
