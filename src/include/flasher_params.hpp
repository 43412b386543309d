#pragma once

namespace flasher {
	// Port layout, offset by the device id
	inline constexpr int WEB_PORT_BASE = 8000;
	inline constexpr int OTA_PORT_BASE = 8200;
	inline constexpr int API_PORT_BASE = 6000;

	inline constexpr int MIN_DEVICE_ID = 1;
	inline constexpr int MAX_DEVICE_ID = 99;

	// Liveness probes
	inline constexpr int PROBE_TIMEOUT_MS     = 3000;
	inline constexpr int PROBE_RETRY_DELAY_MS = 500;
	inline constexpr int PROBE_ATTEMPTS       = 2;
	inline constexpr int METADATA_TIMEOUT_MS  = 5000;
	inline constexpr int EVENTS_READ_LIMIT    = 8192;

	// Discovery sweep
	inline constexpr int DISCOVERY_TIMEOUT_MS = 2000;
	inline constexpr int DISCOVERY_BATCH_SIZE = 20;
	inline constexpr int DISCOVERY_FIRST_PORT = 8201;
	inline constexpr int DISCOVERY_LAST_PORT  = 8299;

	// OTA upload
	inline constexpr int FLASH_TIMEOUT_MS       = 120000;
	inline constexpr int FLASH_CHUNK_SIZE       = 4096;

	// Stores
	inline constexpr int STATUS_LOG_MAX_ENTRIES = 500;
	inline constexpr int OPERATION_MAX_ENTRIES  = 200;
	inline constexpr int OPERATION_MAX_AGE_SEC  = 24 * 3600;

	inline constexpr int SCAN_INTERVAL_SEC = 60;
}
