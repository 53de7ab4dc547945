/* Bstream: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "bstream/util/util_fwd.hpp"
#include <memory>

namespace bstream::util
{

/**
 * Allocator adaptor that turns a value-initialization `T()` into a default-initialization for those types
 * (namely PoDs) for which default-initialization is a no-op.  It is the allocator of util::Chunk.
 *
 * ### What it is for ###
 * A reader filling a util::Chunk via a system call (or a decompressor writing into one) wants to `resize()` it
 * to the maximum it might fill and then `resize()` it down to what was actually produced.  With a plain
 * `std::allocator<uint8_t>` the first `resize()` zero-fills the whole range only for it to be overwritten
 * immediately.  With this adaptor `resize()` leaves the new bytes uninitialized.  Non-PoD `T`s are
 * unaffected: for them value-initialization already equals default-initialization.
 *
 * The technique is the well-known one from
 *   https://stackoverflow.com/questions/21028299/is-this-behavior-of-vectorresizesize-type-n-under-c11-and-boost-container/21028912#21028912
 * which cppreference.com's `vector::resize()` page links in its "Notes."
 *
 * @tparam T
 *         The type managed by this instance of the allocator.
 *         See `Allocator` concept (in standard or cppreference.com).
 * @tparam Allocator
 *         The `Allocator` being adapted; usually the default `std::allocator`.
 */
template <typename T, typename Allocator>
class Default_init_allocator : public Allocator
{
public:
  // Types.

  /// Satisfies `Allocator` concept: the same adaptor over the adaptee rebound to `U`.
  template<typename U>
  struct rebind
  {
    /// See `Allocator` concept.
    using other
      = Default_init_allocator<U, typename std::allocator_traits<Allocator>::template rebind_alloc<U>>;
  };

  // Constructors/destructor.

  /// Inherit adaptee allocator's constructors.
  using Allocator::Allocator;

  // Methods.

  /**
   * Satisfies `Allocator` concept optional requirement for in-place construction: 0-args version,
   * i.e., value-initialization; replaced with default-initialization.
   *
   * @tparam U
   *         Type being constructed.
   * @param ptr
   *        Address at which to in-place-construct the `U`.
   */
  template<typename U>
  void construct(U* ptr) noexcept(std::is_nothrow_default_constructible_v<U>);

  /**
   * Satisfies `Allocator` concept optional requirement for in-place construction: 1+ args version, which
   * behaves identically to the adaptee allocator.
   *
   * @tparam U
   *         Type being constructed.
   * @tparam Args
   *         Constructor args.
   * @param ptr
   *        Address at which to in-place-construct the `U`.
   * @param args
   *        See `Args...`.
   */
  template<typename U, typename... Args>
  void construct(U* ptr, Args&&... args);
}; // class Default_init_allocator

// Template implementations.

template<typename T, typename Allocator>
template <typename U>
void Default_init_allocator<T, Allocator>::construct(U* ptr) noexcept(std::is_nothrow_default_constructible_v<U>)
{
  ::new(static_cast<void*>(ptr)) U;
}

template<typename T, typename Allocator>
template <typename U, typename... Args>
void Default_init_allocator<T, Allocator>::construct(U* ptr, Args&&... args)
{
  std::allocator_traits<Allocator>::construct(static_cast<Allocator&>(*this),
                                              ptr, std::forward<Args>(args)...);
}

} // namespace bstream::util
