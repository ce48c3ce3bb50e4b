// Decoded PLINK genotype matrix
//
// Cells hold the genotype call of a (marker, sample) pair:
//   0, 1, 2  dosage (count of the first .bim allele, a0)
//   3        missing (GENO_MISSING), never part of the dosage range
//
// The cells are kept in the physical order of the .bed file. Armadillo
// matrices are column-major, so every physical .bed row is one contiguous
// column of m_geno:
//   snp-major        m_geno is (nSamples x nMarkers), cell(m, s) = m_geno(s, m)
//   individual-major m_geno is (nMarkers x nSamples), cell(m, s) = m_geno(m, s)
// Logical access is always (marker, sample); nothing is transposed on read.

#ifndef GENOTYPE_MATRIX_HPP
#define GENOTYPE_MATRIX_HPP

#include <armadillo>

#include "bed_format.hpp"

namespace PLINK {

static const unsigned char GENO_MISSING = 3;

class GenotypeMatrix {
private:

    arma::Mat<unsigned char> m_geno;
    BedOrientation m_orientation;
    arma::uword m_nMarkers, m_nSamples;

public:

    GenotypeMatrix();

    // t_geno must already be laid out as described above for t_orientation
    GenotypeMatrix(arma::Mat<unsigned char>&& t_geno, BedOrientation t_orientation);

    arma::uword nMarkers() const { return m_nMarkers; }
    arma::uword nSamples() const { return m_nSamples; }
    BedOrientation orientation() const { return m_orientation; }

    // unchecked
    unsigned char operator()(arma::uword t_marker, arma::uword t_sample) const {
        if (m_orientation == BedOrientation::SNP_MAJOR) {
            return m_geno.at(t_sample, t_marker);
        }
        return m_geno.at(t_marker, t_sample);
    }

    // throws std::out_of_range
    unsigned char at(arma::uword t_marker, arma::uword t_sample) const;

    bool isMissing(arma::uword t_marker, arma::uword t_sample) const {
        return (*this)(t_marker, t_sample) == GENO_MISSING;
    }

    // dosages of one marker over all samples, missing as NaN
    void getOneMarker(arma::uword t_marker, arma::vec& OneMarkerG1) const;

    // dosages of one sample over all markers, missing as NaN
    void getOneSample(arma::uword t_sample, arma::vec& OneSampleG1) const;

    // rows of the logical matrix picked by marker index (e.g. the i column of
    // a MarkerTable), shape (t_markerIndex.n_elem x nSamples)
    arma::Mat<unsigned char> subsetMarkers(const arma::uvec& t_markerIndex) const;

    // logical (nMarkers x nSamples) copy
    arma::Mat<unsigned char> toMat() const;

    // logical (nMarkers x nSamples) dosage matrix, missing as NaN
    arma::mat toDosageMat() const;

    arma::uword countMissing() const;

    const arma::Mat<unsigned char>& physical() const { return m_geno; }
};

} // namespace PLINK

#endif
