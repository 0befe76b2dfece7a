/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_H_INCLUDED__
#define __S3WIRE_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define S3WIRE_VERSION_MAJOR 1
#define S3WIRE_VERSION_MINOR 0
#define S3WIRE_VERSION_PATCH 0

#define S3WIRE_MAKE_VERSION(major, minor, patch)                               \
    ((major) *10000 + (minor) *100 + (patch))
#define S3WIRE_VERSION                                                         \
    S3WIRE_MAKE_VERSION (S3WIRE_VERSION_MAJOR, S3WIRE_VERSION_MINOR,           \
                         S3WIRE_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined S3WIRE_NO_EXPORT
#define S3WIRE_EXPORT
#else
#if defined _WIN32
#if defined S3WIRE_STATIC
#define S3WIRE_EXPORT
#elif defined DLL_EXPORT
#define S3WIRE_EXPORT __declspec(dllexport)
#else
#define S3WIRE_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define S3WIRE_EXPORT __attribute__ ((visibility ("default")))
#else
#define S3WIRE_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  Errors.                                                                   */
/******************************************************************************/

/*  Native errno values used by the library that some platforms lack.        */
#define S3WIRE_HAUSNUMERO 156384912

#ifndef EOVERFLOW
#define EOVERFLOW (S3WIRE_HAUSNUMERO + 1)
#endif
#ifndef EPROTO
#define EPROTO (S3WIRE_HAUSNUMERO + 2)
#endif
#ifndef EMSGSIZE
#define EMSGSIZE (S3WIRE_HAUSNUMERO + 3)
#endif

S3WIRE_EXPORT int s3wire_errno (void);
S3WIRE_EXPORT const char *s3wire_strerror (int errnum_);
S3WIRE_EXPORT void s3wire_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Checksum algorithms (bit set).                                            */
/******************************************************************************/

#define S3WIRE_CHECKSUM_CRC32 0x01
#define S3WIRE_CHECKSUM_CRC32C 0x02
#define S3WIRE_CHECKSUM_SHA1 0x04
#define S3WIRE_CHECKSUM_SHA256 0x08
#define S3WIRE_CHECKSUM_CRC64NVME 0x10
#define S3WIRE_CHECKSUM_ALL                                                    \
    (S3WIRE_CHECKSUM_CRC32 | S3WIRE_CHECKSUM_CRC32C | S3WIRE_CHECKSUM_SHA1     \
     | S3WIRE_CHECKSUM_SHA256 | S3WIRE_CHECKSUM_CRC64NVME)

/******************************************************************************/
/*  Options.                                                                  */
/******************************************************************************/

#define S3WIRE_CHECKSUM_ALGORITHMS 1
#define S3WIRE_MAX_FRAME_SIZE 2
#define S3WIRE_WRITE_BATCH 3

#ifdef __cplusplus
}
#endif

#endif
