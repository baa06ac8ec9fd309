#ifndef H_STOW_TYPES_V0
#define H_STOW_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        StowStatusCode_Success = 0,
        StowStatusCode_InvalidArgument,
        StowStatusCode_InvalidSettings,
        StowStatusCode_InternalError,
        StowStatusCode_IOError,
        StowStatusCode_NetworkError,
        StowStatusCode_Cancelled,
        StowStatusCode_NotFound,
        StowStatusCode_ResumeMismatch,
        StowStatusCode_NotSupported,
        StowStatusCodeCount,
    } StowStatusCode;

    typedef enum
    {
        StowLogLevel_Debug = 0,
        StowLogLevel_Info,
        StowLogLevel_Warning,
        StowLogLevel_Error,
        StowLogLevel_None,
        StowLogLevelCount
    } StowLogLevel;

    /**
     * @brief S3 settings for writing to an object store.
     * @details Credentials are read from the AWS_ACCESS_KEY_ID and
     * AWS_SECRET_ACCESS_KEY environment variables.
     */
    typedef struct
    {
        const char* endpoint;
        const char* bucket_name;
        const char* region;
    } StowS3Settings;

    /**
     * @brief A single user metadata attribute attached to the stored object.
     */
    typedef struct
    {
        const char* key;
        const char* value;
    } StowMetadataEntry;
#ifdef __cplusplus
}
#endif

#endif // H_STOW_TYPES_V0
