#include "document.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>


namespace {
    //! accepts a numeric prefix like strtof does, rejects NaN/Inf
    bool parse_float(const std::string &token, float &out) {
        const char *begin = token.c_str();
        char *end = nullptr;
        const float v = std::strtof(begin, &end);
        if(end == begin || !std::isfinite(v)) {
            return false;
        }
        out = v;
        return true;
    }

    //! decimal palette code or 0x prefixed direct color
    bool parse_color(const std::string &token, ldraw::color &out) {
        const bool is_hex = token.size() > 1 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X');
        const char *begin = is_hex ? token.c_str() + 2 : token.c_str();
        // strtoll would take a sign or blanks after the prefix
        if(is_hex && !std::isxdigit((unsigned char)begin[0])) {
            return false;
        }
        char *end = nullptr;

        errno = 0;
        const long long v = std::strtoll(begin, &end, is_hex ? 16 : 10);
        if(end == begin || errno == ERANGE) {
            return false;
        }
        out = { is_hex, (int64_t)v };
        return true;
    }

    std::vector<std::string> tokenize(const std::string &line) {
        std::vector<std::string> tokens;
        std::istringstream iss(line);
        std::string tok;
        while(iss >> tok) {
            tokens.push_back(tok);
        }
        return tokens;
    }

    bool parse_tokens(const std::vector<std::string> &tokens, ldraw::placement &out) {
        if(tokens.empty() || tokens[0] != "1") {
            return false;
        }
        if(tokens.size() < 14) {
            return false;
        }

        ldraw::placement p;
        if(!parse_color(tokens[1], p._color)) return false;
        if(!parse_float(tokens[2], p._position.x)) return false;
        if(!parse_float(tokens[3], p._position.y)) return false;
        if(!parse_float(tokens[4], p._position.z)) return false;

        // a broken matrix is replaced by identity, the record survives
        glm::mat3 rot(1);
        bool rot_valid = true;
        for(int n = 0; n < 9 && rot_valid; n++) {
            rot_valid = parse_float(tokens[5 + n], rot[n % 3][n / 3]);
        }
        p._rotation = rot_valid ? rot : glm::mat3(1);

        // file names may contain spaces
        for(size_t n = 14; n < tokens.size(); n++) {
            if(n > 14) p._part += " ";
            p._part += tokens[n];
        }

        out = p;
        return true;
    }
};

namespace ldraw {
    std::vector<std::string> document::default_header(const std::string &name, const std::string &author) {
        return {
            name,
            "Name: " + name,
            "Author: " + author,
            "!LICENSE Redistributable under CCAL version 2.0 : see CAreadme.txt"
        };
    }

    std::string document::serialize_line(const placement &p) {
        std::ostringstream oss;
        oss.precision(9);
        oss << "1 " << p._color.token() << " "
            << p._position.x << " " << p._position.y << " " << p._position.z;
        // glm is column major, LDraw lists the matrix row by row
        for(int row = 0; row < 3; row++)
        for(int col = 0; col < 3; col++) {
            oss << " " << p._rotation[col][row];
        }
        oss << " " << p._part;
        return oss.str();
    }

    std::string document::serialize(const std::vector<placement> &records, const std::vector<std::string> &header) {
        std::ostringstream oss;
        for(const std::string &meta : header) {
            oss << "0 " << meta << "\n";
        }
        oss << "\n";
        for(size_t i = 0; i < records.size(); i++) {
            oss << serialize_line(records[i]);
            if(i + 1 < records.size()) oss << "\n";
        }
        return oss.str();
    }

    bool document::parse_line(const std::string &line, placement &out) {
        return parse_tokens(tokenize(line), out);
    }

    std::vector<placement> document::parse(const std::string &text) {
        std::vector<placement> res;
        std::istringstream iss(text);
        std::string line;
        size_t skipped = 0;
        while(std::getline(iss, line)) {
            const std::vector<std::string> tokens = tokenize(line);
            // empty lines, "0" meta lines and other line types
            if(tokens.empty() || tokens[0] != "1") {
                continue;
            }
            placement p;
            if(parse_tokens(tokens, p)) {
                res.push_back(p);
            }
            else {
                skipped++;
            }
        }
        if(skipped > 0) {
            std::cerr << "document::parse(): skipped " << skipped << " malformed lines" << std::endl;
        }
        return res;
    }

    bool document::load(const std::string &file, std::string &out_text) {
        std::ifstream ifs(file);
        if(!ifs.is_open()) {
            std::cerr << file << ": could not be loaded" << std::endl;
            return false;
        }
        std::ostringstream oss;
        oss << ifs.rdbuf();
        out_text = oss.str();
        return true;
    }

    bool document::save(const std::string &file, const std::string &text) {
        std::ofstream ofs(file, std::ios::out | std::ios::trunc);
        if(!ofs.is_open()) {
            std::cerr << file << ": could not be written" << std::endl;
            return false;
        }
        ofs << text;
        return ofs.good();
    }
};
