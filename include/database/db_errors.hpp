#ifndef FORUMBOT_DB_ERRORS_HPP
#define FORUMBOT_DB_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace forumbot {

// A statement failed. `code()` is the SQLite primary/extended result code.
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& what, int code)
        : std::runtime_error(what), code_(code) {}

    int code() const { return code_; }
    bool isConstraintViolation() const { return (code_ & 0xff) == 19; } // SQLITE_CONSTRAINT

private:
    int code_;
};

// Submission to a write queue that no longer accepts jobs.
class QueueClosedError : public std::runtime_error {
public:
    QueueClosedError() : std::runtime_error("write queue is closed") {}
};

// Schema setup hit something other than an already-applied step.
class MigrationError : public std::runtime_error {
public:
    explicit MigrationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace forumbot

#endif // FORUMBOT_DB_ERRORS_HPP
