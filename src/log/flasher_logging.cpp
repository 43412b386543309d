#include "flasher_logging.hpp"

Q_LOGGING_CATEGORY(LC_SCAN,     "flasher.scan")
Q_LOGGING_CATEGORY(LC_DISCOVER, "flasher.discover")
Q_LOGGING_CATEGORY(LC_OTA,      "flasher.ota")
Q_LOGGING_CATEGORY(LC_STORE,    "flasher.store")
