#include "reel/logging.hpp"

namespace reel {

Q_LOGGING_CATEGORY(lcCapture, "reel.capture")
Q_LOGGING_CATEGORY(lcStore, "reel.store")
Q_LOGGING_CATEGORY(lcTransfer, "reel.transfer")
Q_LOGGING_CATEGORY(lcApp, "reel.app")

}  // namespace reel
