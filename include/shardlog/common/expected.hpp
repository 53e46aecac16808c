// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <utility>

namespace shardlog {
namespace common {
// Holds either a value or an error. Callers check ok() before touching val().
template <class ExpectedT, class UnexpectedT> class Expected {
  private:
    bool _is_set{false};
    ExpectedT _val{};
    UnexpectedT _unexpected{};

  public:
    // coverity[autosar_cpp14_a12_1_4_violation] implicit conversion from the value is intended
    Expected(ExpectedT &&val) : _is_set(true), _val(std::move(val)) {
    }
    // coverity[autosar_cpp14_a12_1_4_violation] implicit conversion from the error is intended
    Expected(UnexpectedT &&unexpect) : _unexpected(std::move(unexpect)) {
    }
    // coverity[misra_cpp_2008_rule_14_7_1_violation] keep the copying overloads even if currently unused
    Expected(const ExpectedT &val) : _is_set(true), _val(val) {
    }
    Expected(const UnexpectedT &unexpect) : _unexpected(unexpect) {
    }

    bool ok() const {
        return _is_set;
    }

    explicit operator bool() const {
        return _is_set;
    }

    const ExpectedT &val() const & {
        return _val;
    }
    ExpectedT &val() & {
        return _val;
    }
    ExpectedT &&val() && {
        return std::move(_val);
    }

    const UnexpectedT &err() const & {
        return _unexpected;
    }
    UnexpectedT &err() & {
        return _unexpected;
    }
    UnexpectedT &&err() && {
        return std::move(_unexpected);
    }
};
} // namespace common
} // namespace shardlog
