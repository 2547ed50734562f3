#pragma once

#include "enums.h"
#include "family.h"
#include "palette/palette.h"

#include <pugixml.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <iostream>
#include <filesystem>
#include <vector>
#include <regex>


namespace cfg {
    //! shape settings
    struct shape_settings {
        std::string _file_in;
        std::string _file_out;
        uint32_t    _color_rgb = 0xFFFFFF;
        color_mode  _color_mode = quantized;
    };

    //! project settings
    //! <project>
    //!   <grid resolution="40" family="plate" max_voxels="8000000"/>
    //!   <target dir_out="out" author="brickify"/>
    //!   <shape file_in="a.stl" file_out="a.ldr" color="#C91A09" color_mode="quantized"/>
    //! </project>
    class xml_project {
        std::string                 _project_file = "";
        std::vector<shape_settings> _shapes;

        int                         _resolution = 100;          // columns along the longer footprint axis
        block_family                _family = plate;
        size_t                      _max_voxels = 8000000;      // refuse grids larger than this

        std::string                 _target_dir = "";
        std::string                 _author = "brickify";

        static bool endsWithIgnoreCase(const std::string& str, const std::string& suffix) {
            return std::regex_search(str, std::regex(std::string(suffix) + "$", std::regex_constants::icase));
        }

        static color_mode read_color_mode(const std::string &mode) {
            if(mode.empty() || mode == "quantized") return quantized;
            if(mode == "direct") return direct;
            std::cerr << "xml_project: unknown color_mode \"" << mode << "\", using quantized" << std::endl;
            return quantized;
        }

        static uint32_t read_color(const std::string &hex) {
            uint32_t rgb = 0xFFFFFF;
            if(!hex.empty() && !palette::parse_hex(hex, rgb)) {
                std::cerr << "xml_project: invalid color \"" << hex << "\", using #ffffff" << std::endl;
                rgb = 0xFFFFFF;
            }
            return rgb;
        }

        pugi::xml_parse_result read_project() {
            pugi::xml_document doc;
            pugi::xml_parse_result result = doc.load_file(_project_file.c_str());
            if (!result) {
                std::cerr << "xml_project: " << _project_file << ": " << result.description() << std::endl;
                return result;
            }

            const pugi::xml_node project = doc.child("project");
            for (pugi::xml_node shape : project.children("shape")) {
                shape_settings s;
                s._file_in = shape.attribute("file_in").as_string();
                s._file_out = shape.attribute("file_out").as_string();
                if(s._file_out.empty()) {
                    s._file_out = std::filesystem::path(s._file_in).stem().string() + ".ldr";
                }
                s._color_rgb = read_color(shape.attribute("color").as_string());
                s._color_mode = read_color_mode(shape.attribute("color_mode").as_string());
                _shapes.push_back(s);
            }
            pugi::xml_node g = project.child("grid");
            if(!g.empty()) {
                _resolution = g.attribute("resolution").as_int(_resolution);
                _max_voxels = (size_t)g.attribute("max_voxels").as_ullong(_max_voxels);

                const std::string family = g.attribute("family").as_string("plate");
                if(!family_from_string(family, _family)) {
                    std::cerr << "xml_project: unknown family \"" << family << "\", using plate" << std::endl;
                    _family = plate;
                }
            }
            pugi::xml_node t = project.child("target");
            if(!t.empty()) {
                _target_dir = t.attribute("dir_out").as_string();
                _author = t.attribute("author").as_string(_author.c_str());
            }
            return result;
        }

    public:
        int resolution() const {
            return _resolution;
        }
        block_family family() const {
            return _family;
        }
        size_t max_voxels() const {
            return _max_voxels;
        }
        const std::vector<shape_settings> &shapes() const {
            return _shapes;
        }
        const std::string &author() const {
            return _author;
        }
        const std::string &project_file() const {
            return _project_file;
        }
        std::string project_path() const {
            return std::filesystem::path(_project_file).parent_path().string();
        }
        //! output directory, relative paths are relative to the project file
        std::string target_dir() const {
            const std::filesystem::path t(_target_dir);
            return t.is_absolute() ? t.string() : (std::filesystem::path(project_path()) / t).string();
        }
        bool valid() const {
            return !_project_file.empty();
        }

        void init(const std::string &project_dir) {
            if(!std::filesystem::exists(project_dir)) {
                std::cerr << "xml_project::init() - invalid project config: " << project_dir << std::endl;
                return;
            }

            // the first xml file in alphabetical order wins
            std::vector<std::string> xml_files;
            for (const auto& entry : std::filesystem::directory_iterator(project_dir)) {
                if(endsWithIgnoreCase(entry.path().string(), ".xml")) {
                    xml_files.push_back(entry.path().string());
                }
            }
            std::sort(xml_files.begin(), xml_files.end());
            if(xml_files.size() > 0) {
                std::cout << "add file: " << xml_files.at(0) << std::endl;
                _project_file = xml_files.at(0);
                if(!read_project()) {
                    _project_file.clear();
                }
            }
            else {
                std::cerr << "xml_project::init() - no project file in " << project_dir << std::endl;
            }
        }

        xml_project() = default;
        xml_project(const std::string &project_dir) {
            init(project_dir);
            if(!valid()) return;

            const std::string dir = target_dir();
            std::error_code ec;
            if(!std::filesystem::exists(dir, ec)) {
                std::cout << dir << " does not exist. Create new directory" << std::endl;
                std::filesystem::create_directories(dir, ec);
                if(ec) {
                    std::cerr << "xml_project: " << dir << ": " << ec.message() << std::endl;
                }
            }
        }
    };
};
