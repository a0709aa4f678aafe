#include "errno_codes.hpp"

#include <cerrno>

namespace speechmaker::util {

std::string ErrnoName(int value) {
  switch (value) {
    case ENOENT:
      return "ENOENT";
    case EACCES:
      return "EACCES";
    case EPERM:
      return "EPERM";
    case EISDIR:
      return "EISDIR";
    case ENOTDIR:
      return "ENOTDIR";
    case EMFILE:
      return "EMFILE";
    case ENFILE:
      return "ENFILE";
    case ENOSPC:
      return "ENOSPC";
    case EEXIST:
      return "EEXIST";
    case EROFS:
      return "EROFS";
    case ETIMEDOUT:
      return "ETIMEDOUT";
    case ECANCELED:
      return "ECANCELED";
    case ENOEXEC:
      return "ENOEXEC";
    default:
      return "E" + std::to_string(value);
  }
}

} // namespace speechmaker::util
