#include "exception.hpp"

namespace nbtcpp {

    std::string_view error_kind_name(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::UnexpectedEof:
                return "unexpected end of stream";
            case ErrorKind::MalformedText:
                return "malformed text";
            case ErrorKind::InvalidLength:
                return "invalid length";
            case ErrorKind::UnknownTag:
                return "unknown type identifier";
            case ErrorKind::MissingRootCompound:
                return "missing root compound";
            case ErrorKind::HeterogeneousList:
                return "heterogeneous list";
            case ErrorKind::NestingTooDeep:
                return "nesting too deep";
            case ErrorKind::TypeMismatch:
                return "type mismatch";
            case ErrorKind::KeyNotFound:
                return "key not found";
            case ErrorKind::Io:
                return "i/o failure";
            case ErrorKind::Compression:
                return "compression failure";
            case ErrorKind::Json:
                return "json failure";
        }
        return "unknown error";
    }

} // namespace nbtcpp
