#pragma once

#include <string>

/**
 * @brief Media categories accepted by the inference endpoint
 *
 * UNKNOWN is what fromString() yields for anything it does not recognise; it is
 * never scored.
 */
enum class MediaType
{
    IMAGE,
    VIDEO,
    AUDIO,
    UNKNOWN
};

class MediaTypes
{
public:
    /**
     * @brief Get the media type name as sent on the wire
     * @param type The media type
     * @return Upper-case name ("IMAGE", "VIDEO", "AUDIO", "UNKNOWN")
     */
    static std::string getName(MediaType type)
    {
        switch (type)
        {
        case MediaType::IMAGE:
            return "IMAGE";
        case MediaType::VIDEO:
            return "VIDEO";
        case MediaType::AUDIO:
            return "AUDIO";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Convert the wire name to a MediaType
     * @param type_str Name as received ("IMAGE", "video", ...)
     * @return MediaType, UNKNOWN when the name is not recognised
     */
    static MediaType fromString(const std::string &type_str)
    {
        if (type_str == "IMAGE" || type_str == "image")
            return MediaType::IMAGE;
        else if (type_str == "VIDEO" || type_str == "video")
            return MediaType::VIDEO;
        else if (type_str == "AUDIO" || type_str == "audio")
            return MediaType::AUDIO;
        else
            return MediaType::UNKNOWN;
    }

    /**
     * @brief Whether the image classifier can score this media type
     */
    static bool isScorable(MediaType type)
    {
        return type == MediaType::IMAGE || type == MediaType::VIDEO;
    }
};
