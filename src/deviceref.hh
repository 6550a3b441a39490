#ifndef __BRF_DEVICEREF_HH__
#define __BRF_DEVICEREF_HH__

#include <memory>

namespace brf {

/** Holds an exclusively borrowed device. The holder must not outlive the device and at most one
 * stream should borrow a device at any time.
 *
 * A borrowed reference is move-only, the source of a move is left empty. */
template <class Dev>
class Borrowed
{
public:
  /** The device type. */
  typedef Dev Device;

public:
  /** Borrows the given device. */
  Borrowed(Dev &device): _device(&device) { }
  /** Move constructor. */
  Borrowed(Borrowed &&other): _device(other._device) { other._device = 0; }
  /** Move assignment. */
  Borrowed &operator= (Borrowed &&other) {
    _device = other._device; other._device = 0;
    return *this;
  }

  /** Returns the device or 0 if the reference was moved away. */
  inline Dev *get() const { return _device; }

protected:
  /** The borrowed device. */
  Dev *_device;
};


/** Holds a reference counted device. The device lives until the last holder is gone, hence a
 * stream holding a shared device may be passed to another thread.
 *
 * A shared reference is move-only, the source of a move is left empty. Use @c pointer to obtain
 * another reference to the device. */
template <class Dev>
class Shared
{
public:
  /** The device type. */
  typedef Dev Device;

public:
  /** Shares the given device. */
  Shared(const std::shared_ptr<Dev> &device): _device(device) { }
  /** Move constructor. */
  Shared(Shared &&other): _device(std::move(other._device)) { }
  /** Move assignment. */
  Shared &operator= (Shared &&other) {
    _device = std::move(other._device);
    return *this;
  }

  /** Returns the device or 0 if the reference was moved away. */
  inline Dev *get() const { return _device.get(); }
  /** Returns the shared pointer to the device. */
  inline const std::shared_ptr<Dev> &pointer() const { return _device; }

protected:
  /** The shared device. */
  std::shared_ptr<Dev> _device;
};

}

#endif // __BRF_DEVICEREF_HH__
