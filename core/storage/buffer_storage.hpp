/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace trestle::storage {

  using common::Buffer;
  using common::BufferView;

  /**
   * @brief An abstraction over a readable, writeable, iterable key-value map
   * of byte buffers
   */
  class BufferStorage {
   public:
    virtual ~BufferStorage() = default;

    /**
     * @brief Checks if given key-value binding exists in the storage.
     * @return true if key has value, false if does not, or error
     */
    virtual outcome::result<bool> contains(const BufferView &key) const = 0;

    /**
     * @brief Returns true if the storage is empty.
     */
    virtual bool empty() const = 0;

    /**
     * @brief Get value by key
     * @return value or DatabaseError::NOT_FOUND
     */
    virtual outcome::result<Buffer> get(const BufferView &key) const = 0;

    /**
     * @brief Get value by key
     * @return value if contains(key) or std::nullopt
     */
    virtual outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const = 0;

    /**
     * @brief Store value by key
     */
    virtual outcome::result<void> put(const BufferView &key, Buffer value) = 0;

    /**
     * @brief Remove value by key, no-op for a missing key
     */
    virtual outcome::result<void> remove(const BufferView &key) = 0;

    /**
     * @brief Keys starting with the prefix, in ascending order
     */
    virtual outcome::result<std::vector<Buffer>> keysWithPrefix(
        const BufferView &prefix) const = 0;
  };

}  // namespace trestle::storage
