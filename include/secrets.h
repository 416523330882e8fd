#pragma once

// Device credentials. Fill these in locally (or pass -D flags); do not commit real values.
// An empty access token stops the firmware at boot before any connection attempt.

#ifndef DEVICE_ACCESS_TOKEN
#define DEVICE_ACCESS_TOKEN ""
#endif
#ifndef WIFI_SSID
#define WIFI_SSID ""
#endif
#ifndef WIFI_PASS
#define WIFI_PASS ""
#endif
