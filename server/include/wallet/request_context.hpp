/*
 * 설명: 요청 범위 메타데이터를 타입이 있는 키로 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/request_id_test.cpp
 */
#pragma once

#include <any>
#include <unordered_map>
#include <utility>

namespace wallet {

// 키는 주소로 비교한다. 같은 타입의 키라도 객체가 다르면 충돌하지 않는다.
template <typename T>
class ContextKey {
 public:
  ContextKey() = default;
  ContextKey(const ContextKey&) = delete;
  ContextKey& operator=(const ContextKey&) = delete;
};

// 불변 값 객체. WithValue는 기존 컨텍스트를 바꾸지 않고 새 컨텍스트를 돌려준다.
class RequestContext {
 public:
  template <typename T>
  RequestContext WithValue(const ContextKey<T>& key, T value) const {
    RequestContext next = *this;
    next.values_[&key] = std::move(value);
    return next;
  }

  template <typename T>
  const T* Value(const ContextKey<T>& key) const {
    auto it = values_.find(&key);
    if (it == values_.end()) {
      return nullptr;
    }
    return std::any_cast<T>(&it->second);
  }

 private:
  std::unordered_map<const void*, std::any> values_;
};

}  // namespace wallet
