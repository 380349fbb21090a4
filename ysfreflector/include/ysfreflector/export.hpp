// Copyright (c) 2025
#pragma once

#if defined(_WIN32)
#if defined(YSF_REFLECTOR_BUILDING_DLL)
#define YSF_REFLECTOR_API __declspec(dllexport)
#elif defined(YSF_REFLECTOR_SHARED)
#define YSF_REFLECTOR_API __declspec(dllimport)
#else
#define YSF_REFLECTOR_API
#endif
#else
#define YSF_REFLECTOR_API
#endif
