#pragma once

/// @file mjson.hpp
/// @brief Main include file for the mjson marshalling core.
///
/// Includes all components:
///   - JsonValue, String / Key     - value model with shared string storage
///   - Singletons                  - shared true / false / null / ""
///   - KeyCache                    - interning of object member names
///   - materialize_number          - numeral text -> narrowest value
///   - FloatSerializer             - double -> numeral, non-finite policy
///   - decode_one / decode_next    - decoding, with the 2-byte literal fast path
///   - encode / try_encode         - serialization with option flags
///   - Error handling via exceptions and std::error_code
///
/// Usage example:
/// @code
///   #include <mjson/mjson.hpp>
///
///   auto doc = mjson::decode_one(R"({"name": "mjson", "ratio": NaN})");
///   std::string name = doc["name"].as_string();
///
///   std::string out = mjson::encode(doc, mjson::OPT_SANITIZE_NAN |
///                                        mjson::OPT_SORT_KEYS);
///   // {"name":"mjson","ratio":null}
///
///   std::string_view ndjson = "{\"a\":1}\n{\"a\":2}\n";
///   mjson::decode_each(ndjson, [](mjson::JsonValue&& row) { ... });
/// @endcode

#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "float_serializer.hpp"
#include "fwd.hpp"
#include "key_cache.hpp"
#include "numeric.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "singletons.hpp"
#include "string.hpp"
#include "value.hpp"
