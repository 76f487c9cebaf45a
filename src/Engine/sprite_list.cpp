#include "Engine/sprite_list.hpp"

#include "Engine/sprite_errors.hpp"

// std
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lse {

  SpriteList::~SpriteList() {
    for (const auto &sprite : sprites) {
      sprite->unregisterSpriteList(*this);
    }
  }

  void SpriteList::append(SpritePtr sprite) {
    if (!sprite) {
      throw std::invalid_argument("can't append a null sprite to a sprite list");
    }
    Sprite &member = *sprite;
    sprites.push_back(std::move(sprite));
    try {
      member.registerSpriteList(*this);
    } catch (...) {
      sprites.pop_back();
      throw;
    }
  }

  SpriteList::const_iterator SpriteList::find(const Sprite &sprite) const {
    return std::find_if(sprites.begin(), sprites.end(), [&sprite](const SpritePtr &entry) {
      return entry.get() == &sprite;
    });
  }

  bool SpriteList::contains(const Sprite &sprite) const {
    return find(sprite) != sprites.end();
  }

  void SpriteList::remove(const Sprite &sprite) {
    auto it = find(sprite);
    if (it == sprites.end()) {
      throw SpriteNotFound("sprite is not a member of this sprite list");
    }
    // entry may hold the last reference to sprite
    const SpritePtr removed = *it;
    sprites.erase(it);
    removed->unregisterSpriteList(*this);
  }

  SpritePtr SpriteList::pop() {
    if (sprites.empty()) {
      throw EmptySpriteList("pop from an empty sprite list");
    }
    SpritePtr last = std::move(sprites.back());
    sprites.pop_back();
    last->unregisterSpriteList(*this);
    return last;
  }

  // Both loops walk a copy: a member may kill() itself, or another member,
  // while the batch runs.
  void SpriteList::update() {
    const container_type snapshot = sprites;
    for (const auto &sprite : snapshot) {
      sprite->update();
    }
  }

  void SpriteList::draw(backend::RenderBackend &renderer) const {
    const container_type snapshot = sprites;
    for (const auto &sprite : snapshot) {
      sprite->draw(renderer);
    }
  }

} // namespace lse
