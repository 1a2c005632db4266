#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace connector::models {

    /**
     * @brief Wire model exchanged over Kafka
     *
     * fromJson leaves fields absent from the payload at their defaults,
     * isValid decides whether the decoded message may be acted on.
     */
    class BaseModel {
    public:
        virtual ~BaseModel() = default;

        virtual nlohmann::json toJson() const = 0;

        virtual void fromJson(const nlohmann::json &json) = 0;

        virtual bool isValid() const = 0;

        virtual std::string getTypeName() const = 0;
    };

} // namespace connector::models
