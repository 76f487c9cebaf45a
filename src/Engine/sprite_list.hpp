#pragma once

#include "Engine/Backend/render_backend.hpp"
#include "Engine/sprite.hpp"

// std
#include <cstddef>
#include <memory>
#include <vector>

namespace lse {

  /*
   * Ordered collection of shared sprites. Appending registers the list on the
   * sprite so Sprite::kill() can find it; the list unregisters itself from its
   * remaining members when destroyed. Lists are pinned in memory because
   * sprites refer to them by address.
   *
   * Iterators walk the live sequence: appending, removing or killing members
   * while iterating is undefined behaviour. update() and draw() run over a copy
   * of the membership taken on entry, so members may kill() themselves there;
   * every sprite present on entry is visited exactly once.
   */
  class SpriteList {
  public:
    using container_type = std::vector<SpritePtr>;
    using const_iterator = container_type::const_iterator;

    SpriteList() = default;
    ~SpriteList();

    SpriteList(const SpriteList &) = delete;
    SpriteList &operator=(const SpriteList &) = delete;
    SpriteList(SpriteList &&) = delete;
    SpriteList &operator=(SpriteList &&) = delete;

    void append(SpritePtr sprite);
    // Removes the first entry for sprite. Throws SpriteNotFound if absent.
    void remove(const Sprite &sprite);
    // Removes and returns the last entry. Throws EmptySpriteList if empty.
    SpritePtr pop();
    bool contains(const Sprite &sprite) const;

    void update();
    void draw(backend::RenderBackend &renderer) const;

    std::size_t size() const { return sprites.size(); }
    bool empty() const { return sprites.empty(); }
    const SpritePtr &operator[](std::size_t index) const { return sprites[index]; }
    const_iterator begin() const { return sprites.begin(); }
    const_iterator end() const { return sprites.end(); }

  private:
    const_iterator find(const Sprite &sprite) const;

    container_type sprites;
  };

} // namespace lse
