// ============================================================================
// PvRecorder - Core/Abi/PvRecorderAbi.h
// ----------------------------------------------------------------------------
// Purpose : C declarations of the prebuilt native recorder library: status
//           codes, opaque handle, entry-point signatures and exported names.
// Contract: C99-compatible; mirrors the native ABI exactly. Native truth values
//           are 'int' (never C++ bool); status is the native enum, carried as
//           a 32-bit integer; strings are NUL-terminated, owned by the native
//           side unless stated otherwise. No exceptions cross this boundary.
// Notes   : The native library is never linked at build time. Entry points are
//           resolved by name at runtime (see Core/Interop/RecorderEntryPoints).
//           The status values below are fixed by the native library.
// ============================================================================
#ifndef PVR_ABI_PV_RECORDER_ABI_H
#define PVR_ABI_PV_RECORDER_ABI_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>

// Platform exports and calling convention ------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define PV_RECORDER_CALL __cdecl
    #if defined(PV_RECORDER_EXPORTS)
        #define PV_RECORDER_API __declspec(dllexport)
    #else
        #define PV_RECORDER_API __declspec(dllimport)
    #endif
#else
    #define PV_RECORDER_CALL
    #if defined(__GNUC__) || defined(__clang__)
        #define PV_RECORDER_API __attribute__((visibility("default")))
    #else
        #define PV_RECORDER_API
    #endif
#endif

// Native status codes ---------------------------------------------------------------------
typedef int32_t pv_recorder_status_t;

#define PV_RECORDER_STATUS_SUCCESS                    ((pv_recorder_status_t)0)
#define PV_RECORDER_STATUS_OUT_OF_MEMORY              ((pv_recorder_status_t)1)
#define PV_RECORDER_STATUS_INVALID_ARGUMENT           ((pv_recorder_status_t)2)
#define PV_RECORDER_STATUS_INVALID_STATE              ((pv_recorder_status_t)3)
#define PV_RECORDER_STATUS_BACKEND_ERROR              ((pv_recorder_status_t)4)
#define PV_RECORDER_STATUS_DEVICE_ALREADY_INITIALIZED ((pv_recorder_status_t)5)
#define PV_RECORDER_STATUS_DEVICE_NOT_INITIALIZED     ((pv_recorder_status_t)6)
#define PV_RECORDER_STATUS_IO_ERROR                   ((pv_recorder_status_t)7)
#define PV_RECORDER_STATUS_RUNTIME_ERROR              ((pv_recorder_status_t)8)

// Native truth value: platform 'int', nonzero == true.
typedef int pv_recorder_bool_t;

// Opaque recorder object; only ever handled through pointers.
typedef struct pv_recorder pv_recorder_t;

// Entry-point signatures ------------------------------------------------------------------
typedef pv_recorder_status_t (PV_RECORDER_CALL *pv_recorder_init_fn)(
    int32_t frame_length,
    int32_t device_index,
    int32_t buffered_frames_count,
    pv_recorder_t** object);

typedef void (PV_RECORDER_CALL *pv_recorder_delete_fn)(pv_recorder_t* object);

typedef pv_recorder_status_t (PV_RECORDER_CALL *pv_recorder_start_fn)(pv_recorder_t* object);

typedef pv_recorder_status_t (PV_RECORDER_CALL *pv_recorder_stop_fn)(pv_recorder_t* object);

// Writes exactly frame_length samples into pcm; blocks until a frame is ready.
typedef pv_recorder_status_t (PV_RECORDER_CALL *pv_recorder_read_fn)(pv_recorder_t* object, int16_t* pcm);

typedef void (PV_RECORDER_CALL *pv_recorder_set_debug_logging_fn)(
    pv_recorder_t* object,
    pv_recorder_bool_t is_debug_logging_enabled);

typedef pv_recorder_bool_t (PV_RECORDER_CALL *pv_recorder_get_is_recording_fn)(pv_recorder_t* object);

// Returned string is owned by the recorder object.
typedef const char* (PV_RECORDER_CALL *pv_recorder_get_selected_device_fn)(pv_recorder_t* object);

// On success *device_list is a native array of *device_list_length strings;
// release it with pv_recorder_free_available_devices.
typedef pv_recorder_status_t (PV_RECORDER_CALL *pv_recorder_get_available_devices_fn)(
    int32_t* device_list_length,
    char*** device_list);

typedef void (PV_RECORDER_CALL *pv_recorder_free_available_devices_fn)(
    int32_t device_list_length,
    char** device_list);

typedef int32_t (PV_RECORDER_CALL *pv_recorder_sample_rate_fn)(void);

// Returned string has static storage duration inside the library.
typedef const char* (PV_RECORDER_CALL *pv_recorder_version_fn)(void);

// Exported names --------------------------------------------------------------------------
#define PV_RECORDER_SYMBOL_INIT                   "pv_recorder_init"
#define PV_RECORDER_SYMBOL_DELETE                 "pv_recorder_delete"
#define PV_RECORDER_SYMBOL_START                  "pv_recorder_start"
#define PV_RECORDER_SYMBOL_STOP                   "pv_recorder_stop"
#define PV_RECORDER_SYMBOL_READ                   "pv_recorder_read"
#define PV_RECORDER_SYMBOL_SET_DEBUG_LOGGING      "pv_recorder_set_debug_logging"
#define PV_RECORDER_SYMBOL_GET_IS_RECORDING       "pv_recorder_get_is_recording"
#define PV_RECORDER_SYMBOL_GET_SELECTED_DEVICE    "pv_recorder_get_selected_device"
#define PV_RECORDER_SYMBOL_GET_AVAILABLE_DEVICES  "pv_recorder_get_available_devices"
#define PV_RECORDER_SYMBOL_FREE_AVAILABLE_DEVICES "pv_recorder_free_available_devices"
#define PV_RECORDER_SYMBOL_SAMPLE_RATE            "pv_recorder_sample_rate"
#define PV_RECORDER_SYMBOL_VERSION                "pv_recorder_version"

// Declarations for modules that implement the native layer (test doubles,
// static builds). Host code never calls these directly.
PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_init(
    int32_t frame_length, int32_t device_index, int32_t buffered_frames_count, pv_recorder_t** object);
PV_RECORDER_API void PV_RECORDER_CALL pv_recorder_delete(pv_recorder_t* object);
PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_start(pv_recorder_t* object);
PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_stop(pv_recorder_t* object);
PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_read(pv_recorder_t* object, int16_t* pcm);
PV_RECORDER_API void PV_RECORDER_CALL pv_recorder_set_debug_logging(pv_recorder_t* object, pv_recorder_bool_t is_debug_logging_enabled);
PV_RECORDER_API pv_recorder_bool_t PV_RECORDER_CALL pv_recorder_get_is_recording(pv_recorder_t* object);
PV_RECORDER_API const char* PV_RECORDER_CALL pv_recorder_get_selected_device(pv_recorder_t* object);
PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_get_available_devices(int32_t* device_list_length, char*** device_list);
PV_RECORDER_API void PV_RECORDER_CALL pv_recorder_free_available_devices(int32_t device_list_length, char** device_list);
PV_RECORDER_API int32_t PV_RECORDER_CALL pv_recorder_sample_rate(void);
PV_RECORDER_API const char* PV_RECORDER_CALL pv_recorder_version(void);

#ifdef __cplusplus
} // extern "C"
#endif

#endif // PVR_ABI_PV_RECORDER_ABI_H
