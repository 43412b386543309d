#pragma once

// Common path
#define ROOT									"/var/lib/cactus_flasher/"


// Registry and status log documents
#define CONFIG_PATH								ROOT "config/"
#define BOARDS_FILE								"boards.json"
#define STATUS_LOG_FILE							"board_status_log.json"
#define SETTINGS_FILE							"flasher.ini"


// Sqlite DB
#define DB_PATH                            		ROOT "db/"
#define DB                                  	"cactus_flasher.db"


// Default public host every board is port-forwarded behind
#define DEFAULT_DDNS_HOST						"esp32gb.ddns.net"
