// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * XrayRef - Reference data resolution for X-ray spectroscopy
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef XRAYREF_MODEL_REFERENCE_HPP
#define XRAYREF_MODEL_REFERENCE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace xrayref::model {

/**
 * @brief Optional BibTeX fields of a reference.
 */
struct BibliographicFields {
    std::optional<std::string> author;
    std::optional<std::string> year;
    std::optional<std::string> title;
    std::optional<std::string> type;
    std::optional<std::string> booktitle;
    std::optional<std::string> editor;
    std::optional<std::string> pages;
    std::optional<std::string> edition;
    std::optional<std::string> journal;
    std::optional<std::string> school;
    std::optional<std::string> address;
    std::optional<std::string> url;
    std::optional<std::string> note;
    std::optional<std::string> number;
    std::optional<std::string> series;
    std::optional<std::string> volume;
    std::optional<std::string> publisher;
    std::optional<std::string> organization;
    std::optional<std::string> chapter;
    std::optional<std::string> howpublished;
    std::optional<std::string> doi;
};

/**
 * @brief A literature reference. Identity is the BibTeX key alone; the
 * bibliographic fields do not take part in comparisons.
 */
class Reference {
public:
    /**
     * @throws ValidationError if the key is empty
     */
    explicit Reference(std::string_view bibtexKey,
                       BibliographicFields fields = {});

    [[nodiscard]] const std::string& bibtexKey() const noexcept {
        return bibtexKey_;
    }
    [[nodiscard]] const BibliographicFields& fields() const noexcept {
        return fields_;
    }

    [[nodiscard]] std::string toString() const;

    bool operator==(const Reference& other) const noexcept {
        return bibtexKey_ == other.bibtexKey_;
    }

private:
    std::string bibtexKey_;
    BibliographicFields fields_;
};

std::ostream& operator<<(std::ostream& os, const Reference& reference);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::Reference> {
    std::size_t operator()(
        const xrayref::model::Reference& reference) const noexcept {
        return std::hash<std::string>{}(reference.bibtexKey());
    }
};

#endif  // XRAYREF_MODEL_REFERENCE_HPP
