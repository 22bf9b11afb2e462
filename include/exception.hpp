#ifndef NBTCPP_EXCEPTION_HPP
#define NBTCPP_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace nbtcpp {

    enum class ErrorKind {
        UnexpectedEof = 1,
        MalformedText,
        InvalidLength,
        UnknownTag,
        MissingRootCompound,
        HeterogeneousList,
        NestingTooDeep,
        TypeMismatch,
        KeyNotFound,
        Io,
        Compression,
        Json
    };

    std::string_view error_kind_name(ErrorKind kind);

    class exception : public std::runtime_error {
    public:
        exception(ErrorKind kind, const std::string& what)
            : std::runtime_error(what), m_kind(kind) {}

        ErrorKind kind() const noexcept { return m_kind; }

    private:
        ErrorKind m_kind;
    };

} // namespace nbtcpp

#endif // NBTCPP_EXCEPTION_HPP
