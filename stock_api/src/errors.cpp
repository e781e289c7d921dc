#include "errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::SourceUnavailable:
            return "source_unavailable";
    }
    return "unknown";
}
