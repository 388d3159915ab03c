// Copyright (c) 2025 <Your Name>
#pragma once

#if defined(_WIN32)
#if defined(WTCORE_BUILDING_DLL)
#define WTCORE_API __declspec(dllexport)
#elif defined(WTCORE_SHARED)
#define WTCORE_API __declspec(dllimport)
#else
#define WTCORE_API
#endif
#else
#define WTCORE_API
#endif
