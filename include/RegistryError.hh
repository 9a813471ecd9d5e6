#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode
{
    AlreadyExists,
    NotFound,
    FetchError,
    ParseError,
    IOError
};

inline const char *ErrorCodeName(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::AlreadyExists:
        return "AlreadyExists";
    case ErrorCode::NotFound:
        return "NotFound";
    case ErrorCode::FetchError:
        return "FetchError";
    case ErrorCode::ParseError:
        return "ParseError";
    case ErrorCode::IOError:
        return "IOError";
    }
    return "Unknown";
}

class RegistryError : public std::runtime_error
{
  public:
    RegistryError(ErrorCode code, const std::string &msg) : std::runtime_error(msg), code_(code) {}

    ErrorCode Code() const { return code_; }

  private:
    ErrorCode code_;
};
