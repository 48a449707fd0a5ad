#pragma once

#include <utility>

namespace keyline
{

// Platform surface that can route every event of one pointer to the graph
// regardless of where the pointer travels.
class PointerCaptureTarget
{
   public:
    virtual ~PointerCaptureTarget() = default;

    virtual void set_pointer_capture(int pointer_id)     = 0;
    virtual void release_pointer_capture(int pointer_id) = 0;
};

// Scoped pointer capture. Acquired on construction, released exactly once
// on release(), reassignment or destruction. disown() forgets a capture the
// platform already dropped so it is not released twice.
//
// A null target still tracks the pointer id, for headless use.
class PointerCapture
{
   public:
    PointerCapture() = default;

    PointerCapture(PointerCaptureTarget* target, int pointer_id)
        : target_(target), pointer_id_(pointer_id), active_(true)
    {
        if (target_)
            target_->set_pointer_capture(pointer_id_);
    }

    ~PointerCapture() { release(); }

    PointerCapture(const PointerCapture&)            = delete;
    PointerCapture& operator=(const PointerCapture&) = delete;

    PointerCapture(PointerCapture&& other) noexcept
        : target_(std::exchange(other.target_, nullptr)),
          pointer_id_(other.pointer_id_),
          active_(std::exchange(other.active_, false))
    {
    }

    PointerCapture& operator=(PointerCapture&& other) noexcept
    {
        if (this != &other)
        {
            release();
            target_     = std::exchange(other.target_, nullptr);
            pointer_id_ = other.pointer_id_;
            active_     = std::exchange(other.active_, false);
        }
        return *this;
    }

    void release()
    {
        if (active_ && target_)
            target_->release_pointer_capture(pointer_id_);
        active_ = false;
    }

    void disown() { active_ = false; }

    bool active() const { return active_; }
    int  pointer_id() const { return pointer_id_; }

    // True if this capture owns events of `pointer_id`.
    bool owns(int pointer_id) const { return active_ && pointer_id_ == pointer_id; }

   private:
    PointerCaptureTarget* target_     = nullptr;
    int                   pointer_id_ = 0;
    bool                  active_     = false;
};

}   // namespace keyline
