#ifndef VERITAS_COMMON_SAVE_LOAD_HPP
#define VERITAS_COMMON_SAVE_LOAD_HPP
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <torch/torch.h>

#include "errors.hpp"

namespace Veritas::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            if (!tree.get_child_optional(key)) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Field '" << key << "' in " << context << " is not a valid number";
                throw ConfigurationError(message.str());
            }
            return *value;
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Field '" << key << "' in " << context << " is not a boolean";
                throw ConfigurationError(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            return *value;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw ConfigurationError(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw ConfigurationError(std::string("Failed to parse JSON file '") + path.string() + "': " + error.what());
        }
        return tree;
    }

    // Parameters and buffers of `module` into a single archive file.
    inline void save_module(const torch::nn::Module& module, const std::filesystem::path& path)
    {
        torch::serialize::OutputArchive archive;
        module.save(archive);
        try {
            archive.save_to(path.string());
        } catch (const c10::Error& error) {
            throw CheckpointError(std::string("Failed to write parameters to '") + path.string() + "': " + error.what());
        }
    }

    inline void load_module(torch::nn::Module& module, const std::filesystem::path& path, const torch::Device& device = torch::kCPU)
    {
        if (!std::filesystem::exists(path)) {
            throw CheckpointError(std::string("Parameter archive not found at '") + path.string() + "'.");
        }
        torch::serialize::InputArchive archive;
        try {
            archive.load_from(path.string(), device);
            module.load(archive);
        } catch (const c10::Error& error) {
            throw CheckpointError(std::string("Failed to load parameters from '") + path.string() + "': " + error.what());
        }
    }
}
#endif // VERITAS_COMMON_SAVE_LOAD_HPP
