#include "obj_import.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>


namespace {
    struct corner_t {
        long v = 0;
        long t = 0;
        long n = 0;
    };

    //! "12", "12/34", "12//56" or "12/34/56"
    bool parse_corner(const std::string &s, corner_t &out) {
        long ids[3] = { 0, 0, 0 };
        size_t start = 0;
        for(int field = 0; field < 3; field++) {
            const size_t slash = s.find('/', start);
            const std::string tok = s.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
            if(!tok.empty()) {
                char *end = nullptr;
                ids[field] = std::strtol(tok.c_str(), &end, 10);
                if(end == tok.c_str()) return false;
            }
            if(slash == std::string::npos) break;
            start = slash + 1;
        }
        if(ids[0] == 0) return false;
        out = { ids[0], ids[1], ids[2] };
        return true;
    }

    //! 1-based or negative (relative to the end) -> 0-based, false if out of range
    bool resolve(const long id, const size_t count, size_t &out) {
        const long res = id > 0 ? id - 1 : (long)count + id;
        if(id == 0 || res < 0 || (size_t)res >= count) return false;
        out = (size_t)res;
        return true;
    }

    //! rest of the line without surrounding blanks (names may contain spaces)
    std::string rest_of_line(std::istringstream &iss) {
        std::string rest;
        std::getline(iss, rest);
        const size_t first = rest.find_first_not_of(" \t\r");
        if(first == std::string::npos) return "";
        const size_t last = rest.find_last_not_of(" \t\r");
        return rest.substr(first, last - first + 1);
    }

    bool read_text(const std::string &path, std::string &out) {
        std::ifstream ifs(path);
        if(!ifs) return false;
        std::ostringstream oss;
        oss << ifs.rdbuf();
        out = oss.str();
        return true;
    }
};

namespace obj {
    material_colors parse_mtl(const std::string &text) {
        material_colors res;
        std::string current;

        std::istringstream is(text);
        std::string line;
        while(std::getline(is, line)) {
            std::istringstream iss(line);
            std::string tok;
            if(!(iss >> tok) || tok[0] == '#') continue;

            if(tok == "newmtl") {
                current = rest_of_line(iss);
            }
            else if(tok == "Kd" && !current.empty()) {
                glm::vec3 kd(0);
                if(iss >> kd.r >> kd.g >> kd.b) {
                    res[current] = mesh::pack_rgb(kd);
                }
            }
        }
        return res;
    }

    bool parse(const std::string &text, mesh::triangle_soup &soup, std::string &err, const material_colors &materials) {
        soup.clear();

        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> normals;
        std::vector<glm::vec2> uvs;
        std::vector<uint32_t> vertex_colors;
        uint32_t material_color = mesh::no_color;
        bool any_color = false;
        bool all_normals = true;
        bool all_uvs = true;
        size_t skipped = 0;

        std::istringstream is(text);
        std::string line;
        while(std::getline(is, line)) {
            std::istringstream iss(line);
            std::string tok;
            if(!(iss >> tok) || tok[0] == '#') continue;

            if(tok == "v") {
                glm::vec3 v(0);
                glm::vec3 rgb(0);
                iss >> v.x >> v.y >> v.z;
                positions.push_back(v);
                vertex_colors.push_back((iss >> rgb.r >> rgb.g >> rgb.b) ? mesh::pack_rgb(rgb) : mesh::no_color);
            }
            else if(tok == "vn") {
                glm::vec3 n(0);
                iss >> n.x >> n.y >> n.z;
                normals.push_back(n);
            }
            else if(tok == "vt") {
                glm::vec2 t(0);
                iss >> t.x >> t.y;
                uvs.push_back(t);
            }
            else if(tok == "f") {
                std::vector<corner_t> corners;
                std::string c;
                bool valid = true;
                while(iss >> c) {
                    corner_t corner;
                    valid = valid && parse_corner(c, corner);
                    corners.push_back(corner);
                }
                if(!valid || corners.size() < 3) {
                    skipped++;
                    continue;
                }

                // resolve all corners first, a single bad reference drops the polygon
                std::vector<size_t> vid(corners.size()), nid(corners.size()), tid(corners.size());
                bool has_n = true, has_t = true;
                for(size_t i = 0; i < corners.size() && valid; i++) {
                    valid = resolve(corners[i].v, positions.size(), vid[i]);
                    has_n = has_n && resolve(corners[i].n, normals.size(), nid[i]);
                    has_t = has_t && resolve(corners[i].t, uvs.size(), tid[i]);
                }
                if(!valid) {
                    skipped++;
                    continue;
                }
                all_normals = all_normals && has_n;
                all_uvs = all_uvs && has_t;

                // fan triangulation around the first corner
                for(size_t i = 1; i + 1 < corners.size(); i++) {
                    for(const size_t id : { (size_t)0, i, i + 1 }) {
                        soup._positions.push_back(positions[vid[id]]);
                        soup._normals.push_back(has_n ? normals[nid[id]] : glm::vec3(0));
                        soup._uvs.push_back(has_t ? uvs[tid[id]] : glm::vec2(0));

                        const uint32_t c = vertex_colors[vid[id]] != mesh::no_color ? vertex_colors[vid[id]] : material_color;
                        soup._colors.push_back(c);
                        any_color = any_color || c != mesh::no_color;
                    }
                }
            }
            else if(tok == "usemtl") {
                const auto it = materials.find(rest_of_line(iss));
                material_color = it != materials.end() ? it->second : mesh::no_color;
            }
            // other directives (mtllib, o, g, s, l, ...) are ignored
        }

        // attributes are all or nothing
        if(!all_normals) soup._normals.clear();
        if(!all_uvs) soup._uvs.clear();
        if(!any_color) soup._colors.clear();

        if(skipped > 0) {
            std::cerr << "obj::parse(): skipped " << skipped << " invalid faces" << std::endl;
        }
        if(soup._positions.empty()) {
            err = "no faces found";
            return false;
        }
        return true;
    }

    bool load(const std::string &path, mesh::triangle_soup &soup, std::string &err) {
        std::string text;
        if(!read_text(path, text)) {
            err = "cannot open: " + path;
            return false;
        }

        material_colors materials;
        const std::filesystem::path dir = std::filesystem::path(path).parent_path();
        std::istringstream is(text);
        std::string line;
        while(std::getline(is, line)) {
            std::istringstream iss(line);
            std::string tok;
            if(!(iss >> tok) || tok != "mtllib") continue;

            const std::string lib = (dir / rest_of_line(iss)).string();
            std::string mtl;
            if(!read_text(lib, mtl)) {
                std::cerr << "obj::load(): material library not found: " << lib << std::endl;
                continue;
            }
            const material_colors m = parse_mtl(mtl);
            materials.insert(m.begin(), m.end());
        }

        if(!parse(text, soup, err, materials)) {
            err = path + ": " + err;
            return false;
        }
        return true;
    }
};
