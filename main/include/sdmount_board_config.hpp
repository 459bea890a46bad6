#pragma once

// Board wiring defaults:
// - One preset per supported board; pick it with SDMOUNT_BOARD.
// - Every field can still be overridden from the compiler command line
//   (e.g. -DSDMOUNT_SD_CS=5) when a carrier board re-routes a line.

#define SDMOUNT_BOARD_ESP32S3_DEVKITC 1
#define SDMOUNT_BOARD_FEATHER_HUZZAH32 2
#define SDMOUNT_BOARD_TPAGER 3

#ifndef SDMOUNT_BOARD
#define SDMOUNT_BOARD SDMOUNT_BOARD_ESP32S3_DEVKITC
#endif

#if SDMOUNT_BOARD == SDMOUNT_BOARD_ESP32S3_DEVKITC
//   CS   -> GPIO 16
//   MOSI -> GPIO 11
//   MISO -> GPIO 13
//   SCK  -> GPIO 12
#define SDMOUNT_BOARD_NAME_DEFAULT "esp32s3-devkitc"
#define SDMOUNT_SD_SCK_DEFAULT 12
#define SDMOUNT_SD_MOSI_DEFAULT 11
#define SDMOUNT_SD_MISO_DEFAULT 13
#define SDMOUNT_SD_CS_DEFAULT 16
#define SDMOUNT_SPI_HOST_DEFAULT 1
#define SDMOUNT_MOUNT_POINT_DEFAULT "/sd"
#define SDMOUNT_IDLE_CS_DEFAULT -1
#elif SDMOUNT_BOARD == SDMOUNT_BOARD_FEATHER_HUZZAH32
// Adafruit HUZZAH32 Feather (product 3591), SD on the board SPI header.
#define SDMOUNT_BOARD_NAME_DEFAULT "feather-huzzah32"
#define SDMOUNT_SD_SCK_DEFAULT 5
#define SDMOUNT_SD_MOSI_DEFAULT 18
#define SDMOUNT_SD_MISO_DEFAULT 19
#define SDMOUNT_SD_CS_DEFAULT 4
#define SDMOUNT_SPI_HOST_DEFAULT 2
#define SDMOUNT_MOUNT_POINT_DEFAULT "/sd"
#define SDMOUNT_IDLE_CS_DEFAULT -1
#elif SDMOUNT_BOARD == SDMOUNT_BOARD_TPAGER
// LilyGo T-Pager: SD shares SPI2 with the display, display CS must stay high.
#define SDMOUNT_BOARD_NAME_DEFAULT "tpager"
#define SDMOUNT_SD_SCK_DEFAULT 35
#define SDMOUNT_SD_MOSI_DEFAULT 34
#define SDMOUNT_SD_MISO_DEFAULT 33
#define SDMOUNT_SD_CS_DEFAULT 21
#define SDMOUNT_SPI_HOST_DEFAULT 1
#define SDMOUNT_MOUNT_POINT_DEFAULT "/sdcard"
#define SDMOUNT_IDLE_CS_DEFAULT 38
#else
#error "Unknown SDMOUNT_BOARD"
#endif

#ifndef SDMOUNT_BOARD_NAME
#define SDMOUNT_BOARD_NAME SDMOUNT_BOARD_NAME_DEFAULT
#endif

#ifndef SDMOUNT_SD_SCK
#define SDMOUNT_SD_SCK SDMOUNT_SD_SCK_DEFAULT
#endif

#ifndef SDMOUNT_SD_MOSI
#define SDMOUNT_SD_MOSI SDMOUNT_SD_MOSI_DEFAULT
#endif

#ifndef SDMOUNT_SD_MISO
#define SDMOUNT_SD_MISO SDMOUNT_SD_MISO_DEFAULT
#endif

#ifndef SDMOUNT_SD_CS
#define SDMOUNT_SD_CS SDMOUNT_SD_CS_DEFAULT
#endif

#ifndef SDMOUNT_SPI_HOST
#define SDMOUNT_SPI_HOST SDMOUNT_SPI_HOST_DEFAULT
#endif

// 1 MHz is the fallback for long jumper wires; 4 MHz is clean on all three boards.
#ifndef SDMOUNT_SD_BAUDRATE
#define SDMOUNT_SD_BAUDRATE 4000000
#endif

#ifndef SDMOUNT_IDLE_CS
#define SDMOUNT_IDLE_CS SDMOUNT_IDLE_CS_DEFAULT
#endif

#ifndef SDMOUNT_MOUNT_POINT
#define SDMOUNT_MOUNT_POINT SDMOUNT_MOUNT_POINT_DEFAULT
#endif

// Log verbosity used by the bring-up app: "silent", "diags" or "debug".
#ifndef SDMOUNT_APP_VERBOSITY
#define SDMOUNT_APP_VERBOSITY "diags"
#endif
