#pragma once
#ifndef _ERROR_H_
#define _ERROR_H_
#include <format>
#include <stdexcept>
#include <string>

class InvalidLocation : public std::runtime_error {
public:
    explicit InvalidLocation(const std::string& msg) : std::runtime_error("invalid location: " + msg) {}
};

// row < 0 when the fault is not tied to a single row
class LayoutError : public std::runtime_error {
public:
    LayoutError(const std::string& installation, int row, const std::string& msg)
        : std::runtime_error(row < 0
            ? std::format("layout error in installation '{}': {}", installation, msg)
            : std::format("layout error in installation '{}' row {}: {}", installation, row, msg)),
          _installation(installation), _row(row) {}

    explicit LayoutError(const std::string& msg) : std::runtime_error("layout error: " + msg) {}

    const std::string& installation() const { return _installation; }
    int row() const { return _row; }
private:
    std::string _installation;
    int _row{-1};
};

class OcclusionQueryUnavailable : public std::runtime_error {
public:
    explicit OcclusionQueryUnavailable(const std::string& msg) : std::runtime_error("occlusion query unavailable: " + msg) {}
};
#endif
