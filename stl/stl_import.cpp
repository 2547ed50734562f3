#include "stl_import.h"

#include <array>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {
    constexpr size_t header_size = 80;
    constexpr size_t face_size = 50;
};

namespace stl {
    bool attribute_color(const uint16_t attribute, uint32_t &out_rgb) {
        if(!(attribute & 0x8000)) {
            return false;
        }
        // 5 -> 8 bit channels
        auto channel = [=](const int shift) {
            return ((uint32_t)((attribute >> shift) & 0x1F) * 255 + 15) / 31;
        };
        out_rgb = channel(10) << 16 | channel(5) << 8 | channel(0);
        return true;
    }

    format::format(const std::string &file) {
        if(!load(file)) {
            std::cerr << file << ": could not be loaded" << std::endl;
        }
    }

    bool format::load(const std::string &filename) {
        _faces.clear();

        std::ifstream ifs(filename.c_str(), std::ios::in | std::ios::binary);
        if(!ifs.is_open()) return false;

        ifs.seekg(0, std::ios::end);
        const std::streamoff file_size = ifs.tellg();
        ifs.seekg(0, std::ios::beg);
        if(file_size < (std::streamoff)header_size + 4) {
            return load_ascii(ifs);
        }

        // binary files have an exactly predictable size
        ifs.read(reinterpret_cast<char *>(&_header[0]), header_size);
        uint32_t num_faces = 0;
        ifs.read(reinterpret_cast<char *>(&num_faces), 4);
        const bool is_binary = file_size == (std::streamoff)(header_size + 4 + (size_t)num_faces * face_size);

        ifs.seekg(0, std::ios::beg);
        return is_binary ? load_binary(ifs) : load_ascii(ifs);
    }

    bool format::load_binary(std::istream &is) {
        // read header
        is.read(reinterpret_cast<char *>(&_header[0]), header_size);
        // read number of faces
        uint32_t num_faces = 0;
        is.read(reinterpret_cast<char *>(&num_faces), 4);
        // read the faces
        _faces.resize(num_faces);
        if(num_faces > 0) {
            is.read(reinterpret_cast<char *>(&_faces[0]), num_faces * sizeof(face));
        }
        if(!is) {
            std::cerr << "stl::format: truncated binary file" << std::endl;
            _faces.clear();
            return false;
        }
        return true;
    }

    bool format::load_ascii(std::istream &is) {
        std::string line;
        std::string keyword;
        glm::vec3 norm(0);
        std::vector<glm::vec3> corners;
        bool has_solid = false;

        while(std::getline(is, line)) {
            std::istringstream iss(line);
            if(!(iss >> keyword)) continue;

            if(keyword == "solid") {
                has_solid = true;
            }
            else if(keyword == "facet") {
                std::string normal_kw;
                iss >> normal_kw >> norm.x >> norm.y >> norm.z;
                corners.clear();
            }
            else if(keyword == "vertex") {
                glm::vec3 v;
                if(iss >> v.x >> v.y >> v.z) {
                    corners.push_back(v);
                }
            }
            else if(keyword == "endfacet") {
                // only triangles are valid stl facets
                if(corners.size() == 3) {
                    _faces.push_back(face(norm, corners[0], corners[1], corners[2]));
                }
                corners.clear();
            }
        }
        if(!has_solid) {
            std::cerr << "stl::format: neither binary nor ascii stl" << std::endl;
            return false;
        }
        return true;
    }

    bool format::save(const std::vector<face> &faces, const std::string &file) {
        std::ofstream stl_file(file, std::ios::out | std::ios::binary);
        if(!stl_file.is_open()) return false;

        std::array<char, header_size> header = { 0 };
        stl_file.write((char*)(&header[0]), header.size());
        const uint32_t n_faces = (uint32_t)faces.size();
        stl_file.write((char*)(&n_faces), sizeof(uint32_t));
        stl_file.write((char*)(faces.data()), sizeof(stl::face)*n_faces);
        return stl_file.good();
    }

    const std::vector<face> &format::faces() const {
        return _faces;
    }

    mesh::triangle_soup format::to_soup(const std::vector<face> &faces) {
        mesh::triangle_soup soup;
        soup._positions.reserve(faces.size() * 3);
        soup._normals.reserve(faces.size() * 3);
        bool any_color = false;
        for(const auto &f : faces) {
            uint32_t rgb = mesh::no_color;
            any_color = attribute_color(f._attribute, rgb) || any_color;

            soup.add_face(f._vert_1, f._vert_2, f._vert_3);
            for(int i = 0; i < 3; i++) {
                soup._normals.push_back(f._norm);
                soup._colors.push_back(rgb);
            }
        }
        if(!any_color) {
            soup._colors.clear();
        }
        return soup;
    }
};
