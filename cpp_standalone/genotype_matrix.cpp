// Decoded PLINK genotype matrix

#include "genotype_matrix.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace PLINK {

GenotypeMatrix::GenotypeMatrix()
    : m_orientation(BedOrientation::SNP_MAJOR), m_nMarkers(0), m_nSamples(0)
{
}

GenotypeMatrix::GenotypeMatrix(arma::Mat<unsigned char>&& t_geno,
                               BedOrientation t_orientation)
    : m_geno(std::move(t_geno)), m_orientation(t_orientation)
{
    if (m_orientation == BedOrientation::SNP_MAJOR) {
        m_nSamples = m_geno.n_rows;
        m_nMarkers = m_geno.n_cols;
    } else {
        m_nMarkers = m_geno.n_rows;
        m_nSamples = m_geno.n_cols;
    }
}

unsigned char GenotypeMatrix::at(arma::uword t_marker, arma::uword t_sample) const
{
    if (t_marker >= m_nMarkers || t_sample >= m_nSamples) {
        throw std::out_of_range(
            "GenotypeMatrix::at: (" + std::to_string(t_marker) + ", " +
            std::to_string(t_sample) + ") is outside a " +
            std::to_string(m_nMarkers) + " x " + std::to_string(m_nSamples) +
            " genotype matrix.");
    }
    return (*this)(t_marker, t_sample);
}

void GenotypeMatrix::getOneMarker(arma::uword t_marker, arma::vec& OneMarkerG1) const
{
    if (t_marker >= m_nMarkers) {
        throw std::out_of_range("GenotypeMatrix::getOneMarker: marker index " +
                                std::to_string(t_marker) + " >= " +
                                std::to_string(m_nMarkers));
    }

    OneMarkerG1.set_size(m_nSamples);
    for (arma::uword s = 0; s < m_nSamples; s++) {
        unsigned char g = (*this)(t_marker, s);
        OneMarkerG1[s] = (g == GENO_MISSING) ? arma::datum::nan : (double)g;
    }
}

void GenotypeMatrix::getOneSample(arma::uword t_sample, arma::vec& OneSampleG1) const
{
    if (t_sample >= m_nSamples) {
        throw std::out_of_range("GenotypeMatrix::getOneSample: sample index " +
                                std::to_string(t_sample) + " >= " +
                                std::to_string(m_nSamples));
    }

    OneSampleG1.set_size(m_nMarkers);
    for (arma::uword m = 0; m < m_nMarkers; m++) {
        unsigned char g = (*this)(m, t_sample);
        OneSampleG1[m] = (g == GENO_MISSING) ? arma::datum::nan : (double)g;
    }
}

arma::Mat<unsigned char> GenotypeMatrix::subsetMarkers(const arma::uvec& t_markerIndex) const
{
    if (t_markerIndex.n_elem > 0 && t_markerIndex.max() >= m_nMarkers) {
        throw std::out_of_range("GenotypeMatrix::subsetMarkers: marker index " +
                                std::to_string(t_markerIndex.max()) + " >= " +
                                std::to_string(m_nMarkers));
    }

    if (m_orientation == BedOrientation::SNP_MAJOR) {
        arma::Mat<unsigned char> sub = m_geno.cols(t_markerIndex);
        return sub.t();
    }
    return m_geno.rows(t_markerIndex);
}

arma::Mat<unsigned char> GenotypeMatrix::toMat() const
{
    if (m_orientation == BedOrientation::SNP_MAJOR) {
        return m_geno.t();
    }
    return m_geno;
}

arma::mat GenotypeMatrix::toDosageMat() const
{
    arma::mat dosage = arma::conv_to<arma::mat>::from(toMat());
    dosage.replace((double)GENO_MISSING, arma::datum::nan);
    return dosage;
}

arma::uword GenotypeMatrix::countMissing() const
{
    arma::uword nMissing = 0;
    for (arma::uword k = 0; k < m_geno.n_elem; k++) {
        if (m_geno[k] == GENO_MISSING) {
            nMissing++;
        }
    }
    return nMissing;
}

} // namespace PLINK
