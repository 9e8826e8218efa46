// core/common/result.hpp
#pragma once
#include <string>
#include <utility>

#include "error.hpp"

template<typename T> struct Result {
  T value{};
  bool ok{true};
  Error err{};
  static Result<T> success(T v){ return {std::move(v), true, {}}; }
  static Result<T> failure(ErrorKind k, std::string e){ return {{}, false, {k, std::move(e)}}; }
  static Result<T> failure(Error e){ return {{}, false, std::move(e)}; }
};

// Result without a payload.
struct Status {
  bool ok{true};
  Error err{};
  static Status success(){ return {}; }
  static Status failure(ErrorKind k, std::string e){ return {false, {k, std::move(e)}}; }
  static Status failure(Error e){ return {false, std::move(e)}; }
};
