#pragma once

#include "bsonx/core/error.hpp"

#include <system_error>

namespace bsonx::core {

/**
 * @brief settings 对象的“冻结后只读”基础设施。
 *
 * 约定：
 * - 冻结前由配置线程独占；freeze() 之后可跨线程只读共享；
 * - 冻结后任何 setter 都返回 errc::settings_frozen，且不修改对象；
 * - 派生类的 clone() 返回未冻结副本（拷贝后调用 unfreeze_copy()）。
 */
class Freezable {
 public:
  [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

  void freeze() noexcept { frozen_ = true; }

 protected:
  Freezable() = default;
  Freezable(const Freezable&) = default;
  Freezable& operator=(const Freezable&) = default;
  ~Freezable() = default;

  [[nodiscard]] std::error_code check_mutable() const noexcept {
    if (frozen_) {
      return make_error_code(errc::settings_frozen);
    }
    return {};
  }

  void unfreeze_copy() noexcept { frozen_ = false; }

 private:
  bool frozen_{false};
};

}  // namespace bsonx::core
