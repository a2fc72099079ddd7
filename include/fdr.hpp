#pragma once

#include "fdr_result.hpp"
#include "fdr_sample.hpp"
#include "fdr_time.hpp"
#include <string>
#include <cstddef>

namespace fdr {

    // Configurable at compile-time so hosts can widen the scrub range
    #ifndef FDR_MAX_SPEED_MULTIPLIER
    #define FDR_MAX_SPEED_MULTIPLIER (500.0)
    #endif
    constexpr double MAX_SPEED_MULTIPLIER = FDR_MAX_SPEED_MULTIPLIER;
    constexpr double MIN_SPEED_MULTIPLIER = 1.0;

    enum class Error {
        // Non-fatal errors (< TERMINATE_LOAD)
        Unknown,
        BadTimestamp,
        MissingRequiredValue,
        NonNumericRequiredValue,
        OutOfRangeValue,
        DuplicateTimestamp,
        TooManyCells,
        InvalidParameter,
        UnknownField,
        UnknownLink,
        EmptyDataset,

        // Fatal errors (>= TERMINATE_LOAD)
        TERMINATE_LOAD,
        TERM_MissingRequiredField,
        TERM_DuplicateColumn,
        TERM_EmptyHeader,
        TERM_IOError,
    };

    // Fatal errors abort a whole load, the rest degrade a dataset or reject a call
    constexpr bool is_fatal(Error error) {
        return error >= Error::TERMINATE_LOAD;
    }

    inline const char* to_str(Error error) {
        switch (error) {
            case Error::Unknown: return "Unknown error";
            case Error::BadTimestamp: return "Timestamp could not be parsed";
            case Error::MissingRequiredValue: return "Required value is empty or redacted";
            case Error::NonNumericRequiredValue: return "Required value is not numeric";
            case Error::OutOfRangeValue: return "Value is outside its valid range";
            case Error::DuplicateTimestamp: return "Timestamp already seen, first occurrence kept";
            case Error::TooManyCells: return "Row has more cells than the header";
            case Error::InvalidParameter: return "Invalid parameter";
            case Error::UnknownField: return "Unknown field";
            case Error::UnknownLink: return "Unknown communication link";
            case Error::EmptyDataset: return "Dataset has no records";
            case Error::TERM_MissingRequiredField: return "TERM: Missing required field";
            case Error::TERM_DuplicateColumn: return "TERM: Duplicate column in header";
            case Error::TERM_EmptyHeader: return "TERM: Input has no header row";
            case Error::TERM_IOError: return "TERM: IO error";
            default: return "Unknown error";
        }
    }

    // Stable machine-readable code, used by report consumers
    inline const char* to_code(Error error) {
        switch (error) {
            case Error::BadTimestamp: return "bad_timestamp";
            case Error::MissingRequiredValue: return "missing_required_value";
            case Error::NonNumericRequiredValue: return "non_numeric_required_value";
            case Error::OutOfRangeValue: return "out_of_range_value";
            case Error::DuplicateTimestamp: return "duplicate_timestamp";
            case Error::TooManyCells: return "too_many_cells";
            case Error::InvalidParameter: return "invalid_parameter";
            case Error::UnknownField: return "unknown_field";
            case Error::UnknownLink: return "unknown_link";
            case Error::EmptyDataset: return "empty_dataset";
            case Error::TERM_MissingRequiredField: return "missing_required_field";
            case Error::TERM_DuplicateColumn: return "duplicate_column";
            case Error::TERM_EmptyHeader: return "empty_header";
            case Error::TERM_IOError: return "io_error";
            default: return "unknown";
        }
    }

    // Column-level failure: the load is aborted and nothing is published
    struct SchemaError {
        Error error = Error::Unknown;
        std::string field;

        const char* code() const { return to_code(error); }

        std::string message() const {
            std::string msg = to_str(error);
            if (!field.empty()) {
                msg += ": ";
                msg += field;
            }
            return msg;
        }
    };

} // namespace fdr
