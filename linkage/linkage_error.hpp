#ifndef REARLINK_LINKAGE_ERROR_HPP
#define REARLINK_LINKAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rearlink {

// Base class for every validation failure raised while compiling a linkage.
class LinkageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No points or no rigid bodies were supplied.
class EmptyLinkageError : public LinkageError {
public:
    using LinkageError::LinkageError;
};

class DuplicatePointError : public LinkageError {
public:
    explicit DuplicatePointError(const std::string& point_id)
        : LinkageError("Point id '" + point_id + "' is not unique"),
          point_id_(point_id) {}

    const std::string& point_id() const { return point_id_; }

private:
    std::string point_id_;
};

class UnknownPointError : public LinkageError {
public:
    UnknownPointError(const std::string& body_id, const std::string& point_id)
        : LinkageError("Rigid body '" + body_id + "' references unknown point '" +
                       point_id + "'"),
          body_id_(body_id), point_id_(point_id) {}

    const std::string& body_id() const { return body_id_; }
    const std::string& point_id() const { return point_id_; }

private:
    std::string body_id_;
    std::string point_id_;
};

// Shock body does not join exactly two points.
class InvalidShockError : public LinkageError {
public:
    InvalidShockError(const std::string& body_id, size_t point_count)
        : LinkageError("Shock body '" + body_id + "' must join exactly 2 points, got " +
                       std::to_string(point_count)),
          body_id_(body_id) {}

    const std::string& body_id() const { return body_id_; }

private:
    std::string body_id_;
};

class MissingStrokeError : public LinkageError {
public:
    explicit MissingStrokeError(const std::string& body_id)
        : LinkageError("Shock body '" + body_id + "' must define 'stroke'"),
          body_id_(body_id) {}

    const std::string& body_id() const { return body_id_; }

private:
    std::string body_id_;
};

class MultipleShocksError : public LinkageError {
public:
    MultipleShocksError(const std::string& first_id, const std::string& second_id)
        : LinkageError("Multiple shock bodies found ('" + first_id + "', '" + second_id +
                       "'); only one driver is supported"),
          body_id_(second_id) {}

    // The second shock encountered
    const std::string& body_id() const { return body_id_; }

private:
    std::string body_id_;
};

class MissingShockError : public LinkageError {
public:
    MissingShockError()
        : LinkageError("No shock body found; need exactly one rigid body with type 'shock'") {}
};

// Raised while reading documents: a point/body type outside the closed vocabulary.
class UnknownTypeError : public std::runtime_error {
public:
    UnknownTypeError(const std::string& kind, const std::string& value)
        : std::runtime_error("Unknown " + kind + " type '" + value + "'"),
          value_(value) {}

    const std::string& value() const { return value_; }

private:
    std::string value_;
};

}  // namespace rearlink

#endif // REARLINK_LINKAGE_ERROR_HPP
