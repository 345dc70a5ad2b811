#ifndef H_SHARDSINK_TYPES_V0
#define H_SHARDSINK_TYPES_V0

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        ShardSinkLogLevel_Debug,
        ShardSinkLogLevel_Info,
        ShardSinkLogLevel_Warning,
        ShardSinkLogLevel_Error,
        ShardSinkLogLevel_None,
        ShardSinkLogLevelCount
    } ShardSinkLogLevel;

#ifdef __cplusplus
}
#endif

#endif // H_SHARDSINK_TYPES_V0
